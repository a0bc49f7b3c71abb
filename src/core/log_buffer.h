/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Thread-safe ring buffer for log capture.
 * Stores last N log entries with timestamp, component, and severity,
 * and echoes entries above a threshold to stderr.
 */

#pragma once

#include "xcp360/types.h"
#include <string>
#include <vector>
#include <mutex>
#include <atomic>

namespace xcp360 {

enum class LogSeverity : u8 {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

enum class LogComponent : u8 {
    Core = 0,
    Crypto = 1,
    Container = 2,
    Extract = 3,
    Merge = 4,
    Tool = 5
};

struct LogEntry {
    u64 timestamp_ms;       // milliseconds since process start
    LogSeverity severity;
    LogComponent component;
    std::string message;
};

/**
 * Global log buffer, a singleton ring buffer for all converter stages.
 */
class LogBuffer {
public:
    static LogBuffer& instance();

    /**
     * Add a log entry to the ring buffer.
     * Thread-safe.
     */
    void log(LogSeverity severity, LogComponent component, const char* fmt, ...)
        __attribute__((format(printf, 4, 5)));

    /**
     * Get a snapshot of all entries currently in the buffer.
     * Returns entries from oldest to newest.
     */
    std::vector<LogEntry> get_entries() const;

    /**
     * Get entries filtered by severity and/or component.
     * severity_min: minimum severity to include (Debug=all, Error=errors only)
     * component: filter to specific component, or -1 for all
     */
    std::vector<LogEntry> get_filtered(LogSeverity severity_min,
                                        int component = -1) const;

    /**
     * Format entries at or above severity_min for a log file.
     */
    std::string export_text(LogSeverity severity_min = LogSeverity::Debug) const;

    /**
     * Get total number of entries written (including overwritten).
     */
    u64 total_entries() const { return total_written_.load(); }

    /**
     * Set max buffer size (default 1000). Drops current entries.
     */
    void set_capacity(u32 capacity);

    /**
     * Entries at or above this severity are also printed to stderr.
     */
    void set_echo_level(LogSeverity level) { echo_level_.store(static_cast<u8>(level)); }
    void set_echo_enabled(bool enabled) { echo_enabled_.store(enabled); }

private:
    LogBuffer();
    ~LogBuffer() = default;
    LogBuffer(const LogBuffer&) = delete;
    LogBuffer& operator=(const LogBuffer&) = delete;

    static constexpr u32 DEFAULT_CAPACITY = 1000;

    mutable std::mutex mutex_;
    std::vector<LogEntry> entries_;
    u32 capacity_ = DEFAULT_CAPACITY;
    u32 write_pos_ = 0;
    bool wrapped_ = false;
    std::atomic<u64> total_written_{0};

    std::atomic<u8> echo_level_{static_cast<u8>(LogSeverity::Info)};
    std::atomic<bool> echo_enabled_{true};

    // Start time for relative timestamps
    u64 start_time_ms_ = 0;
};

// Convenience macros
#define XCP360_LOG_D(component, ...) \
    xcp360::LogBuffer::instance().log(xcp360::LogSeverity::Debug, component, __VA_ARGS__)
#define XCP360_LOG_I(component, ...) \
    xcp360::LogBuffer::instance().log(xcp360::LogSeverity::Info, component, __VA_ARGS__)
#define XCP360_LOG_W(component, ...) \
    xcp360::LogBuffer::instance().log(xcp360::LogSeverity::Warning, component, __VA_ARGS__)
#define XCP360_LOG_E(component, ...) \
    xcp360::LogBuffer::instance().log(xcp360::LogSeverity::Error, component, __VA_ARGS__)

} // namespace xcp360
