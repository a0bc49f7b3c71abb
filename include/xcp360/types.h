/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Core type definitions and constants
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>

namespace xcp360 {

// Standard integer types
using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using s8  = std::int8_t;
using s16 = std::int16_t;
using s32 = std::int32_t;
using s64 = std::int64_t;

// Size types
using usize = std::size_t;
using isize = std::ptrdiff_t;

// Byte order conversion
template<typename T>
constexpr T byte_swap(T value) {
    static_assert(std::is_integral_v<T>, "byte_swap requires integral type");

    if constexpr (sizeof(T) == 1) {
        return value;
    } else if constexpr (sizeof(T) == 2) {
        return static_cast<T>(__builtin_bswap16(static_cast<u16>(value)));
    } else if constexpr (sizeof(T) == 4) {
        return static_cast<T>(__builtin_bswap32(static_cast<u32>(value)));
    } else if constexpr (sizeof(T) == 8) {
        return static_cast<T>(__builtin_bswap64(static_cast<u64>(value)));
    }
}

// Cabinet structures are little-endian on disk
template<typename T>
constexpr T from_le(T value) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return byte_swap(value);
#else
    return value;
#endif
}

// Little-endian value wrapper
template<typename T>
struct le {
    T raw;

    le() = default;
    le(T value) : raw(from_le(value)) {}

    operator T() const { return from_le(raw); }
    le& operator=(T value) { raw = from_le(value); return *this; }

    T get() const { return from_le(raw); }
    void set(T value) { raw = from_le(value); }
};

using le_u16 = le<u16>;
using le_u32 = le<u32>;

// Result type for error handling
enum class Status {
    Ok = 0,
    Error,
    InvalidArgument,
    NotFound,
    InvalidKey,         // Header magic mismatch after decryption
    CorruptContainer,   // Offset or size outside the container
    ExtractionFailed,   // Cabinet extractor failed or could not run
    IoError,
};

inline const char* status_to_string(Status s) {
    switch (s) {
        case Status::Ok: return "Ok";
        case Status::Error: return "Error";
        case Status::InvalidArgument: return "InvalidArgument";
        case Status::NotFound: return "NotFound";
        case Status::InvalidKey: return "InvalidKey";
        case Status::CorruptContainer: return "CorruptContainer";
        case Status::ExtractionFailed: return "ExtractionFailed";
        case Status::IoError: return "IoError";
        default: return "Unknown";
    }
}

} // namespace xcp360
