#pragma once

#include <atomic>

namespace xcp360 {

/**
 * Feature Flags for runtime configuration of converter diagnostics.
 *
 * Usage:
 *   if (FeatureFlags::trace_regions) { ... }
 *   FeatureFlags::trace_regions = true;  // Enable at runtime
 *
 * All flags default to false. The xcp_dump tool enables them with --trace.
 */
struct FeatureFlags {
    // === Container Debug Flags ===

    // Log key record and payload offsets of every decrypted region
    static inline std::atomic<bool> trace_regions{false};

    // Log every file-table entry with its original and normalized name
    static inline std::atomic<bool> trace_entries{false};

    // === Reassembly Debug Flags ===

    // Log every member appended to the package
    static inline std::atomic<bool> trace_merge{false};
};

// Conditional debug logging into the log buffer
#define XCP360_TRACE_IF(flag, component, ...) \
    do { if (::xcp360::FeatureFlags::flag.load(std::memory_order_relaxed)) { \
        XCP360_LOG_D(component, __VA_ARGS__); \
    } } while(0)

} // namespace xcp360
