#pragma once

#ifdef __cplusplus

#include <cstdio>
#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tidemark {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Single global log level, defined in TidemarkCore/src/log.cpp.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

// ============================================================================
// log_buffer - bounded queue of formatted lines awaiting shipment
// ============================================================================
//
// Owned by a single shipper. Beyond capacity the oldest line is dropped.
// Reaching flush_threshold hands the queued lines to the shipper; the owner
// is expected to call flush() from its own timer for the remainder.

class log_buffer {
public:
    using shipper = std::function<void(const std::vector<std::string>& lines)>;

    log_buffer(size_t capacity, size_t flush_threshold, shipper ship);

    void push(std::string line);
    void flush();

    size_t size() const;
    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    size_t capacity_;
    size_t flush_threshold_;
    shipper ship_;
    mutable std::mutex mutex_;
    std::deque<std::string> lines_;
    std::atomic<size_t> dropped_{0};
};

/// Route every log line into `buffer` in addition to stderr. nullptr detaches.
void set_log_buffer(std::shared_ptr<log_buffer> buffer);

namespace detail {
#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 3, 4)))
#endif
void log_write(log_level level, const char* tag, const char* fmt, ...);
} // namespace detail

}  // namespace tidemark

#define TIDEMARK_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(tidemark::g_log_level.load(std::memory_order_relaxed))) { \
            tidemark::detail::log_write(level, tag, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) TIDEMARK_LOG(tidemark::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  TIDEMARK_LOG(tidemark::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  TIDEMARK_LOG(tidemark::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) TIDEMARK_LOG(tidemark::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

#endif // __cplusplus
