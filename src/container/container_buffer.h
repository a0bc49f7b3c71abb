/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Container buffer
 *
 * Owns the whole container in memory. All access is bounds-checked;
 * regions are decrypted in place. The file on disk is never touched.
 */

#pragma once

#include "xcp360/types.h"
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

namespace xcp360 {

class RegionCipher;

class ContainerBuffer {
public:
    ContainerBuffer() = default;
    explicit ContainerBuffer(std::vector<u8> data) : data_(std::move(data)) {}

    // Single owner
    ContainerBuffer(const ContainerBuffer&) = delete;
    ContainerBuffer& operator=(const ContainerBuffer&) = delete;
    ContainerBuffer(ContainerBuffer&&) = default;
    ContainerBuffer& operator=(ContainerBuffer&&) = default;

    /**
     * Read an entire container file
     */
    Status load(const std::string& path);

    /**
     * Write the buffer to a file
     */
    Status save(const std::string& path) const;

    usize size() const { return data_.size(); }
    const u8* data() const { return data_.data(); }
    const std::vector<u8>& bytes() const { return data_; }

    /**
     * True if [offset, offset + size) lies inside the buffer
     */
    bool contains(u64 offset, u64 size) const {
        return offset <= data_.size() && size <= data_.size() - offset;
    }

    /**
     * Copy a fixed-layout structure out of the buffer
     */
    template<typename T>
    Status read(u64 offset, T& out) const {
        static_assert(std::is_trivially_copyable_v<T>, "read requires a POD structure");
        if (!contains(offset, sizeof(T))) {
            return Status::CorruptContainer;
        }
        memcpy(&out, data_.data() + offset, sizeof(T));
        return Status::Ok;
    }

    /**
     * Overwrite bytes in place
     */
    Status write(u64 offset, const void* src, usize size);

    /**
     * Run size bytes at offset through the cipher (in-place)
     */
    Status decrypt_range(RegionCipher& cipher, u64 offset, u64 size);

private:
    std::vector<u8> data_;
};

} // namespace xcp360
