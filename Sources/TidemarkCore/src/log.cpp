#include "tidemark/log.hpp"
#include <cstdarg>

namespace tidemark {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::warn};

namespace {
std::mutex g_buffer_mutex;
std::shared_ptr<log_buffer> g_buffer;

const char* level_name(log_level level) {
    switch (level) {
        case log_level::error: return "E";
        case log_level::warn: return "W";
        case log_level::info: return "I";
        case log_level::debug: return "D";
        case log_level::off: break;
    }
    return "-";
}
} // namespace

log_buffer::log_buffer(size_t capacity, size_t flush_threshold, shipper ship)
    : capacity_(capacity == 0 ? 1 : capacity)
    , flush_threshold_(flush_threshold)
    , ship_(std::move(ship))
{}

void log_buffer::push(std::string line) {
    std::vector<std::string> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(std::move(line));
        while (lines_.size() > capacity_) {
            lines_.pop_front();
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
        if (flush_threshold_ == 0 || lines_.size() < flush_threshold_ || !ship_) {
            return;
        }
        batch.assign(std::make_move_iterator(lines_.begin()), std::make_move_iterator(lines_.end()));
        lines_.clear();
    }
    ship_(batch);
}

void log_buffer::flush() {
    std::vector<std::string> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lines_.empty() || !ship_) return;
        batch.assign(std::make_move_iterator(lines_.begin()), std::make_move_iterator(lines_.end()));
        lines_.clear();
    }
    ship_(batch);
}

size_t log_buffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

void set_log_buffer(std::shared_ptr<log_buffer> buffer) {
    std::lock_guard<std::mutex> lock(g_buffer_mutex);
    g_buffer = std::move(buffer);
}

namespace detail {

void log_write(log_level level, const char* tag, const char* fmt, ...) {
    char message[2048];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    std::fprintf(stderr, "[%s] %s\n", tag, message);

    std::shared_ptr<log_buffer> buffer;
    {
        std::lock_guard<std::mutex> lock(g_buffer_mutex);
        buffer = g_buffer;
    }
    if (buffer) {
        std::string line = std::string(level_name(level)) + " [" + tag + "] " + message;
        buffer->push(std::move(line));
    }
}

} // namespace detail

} // namespace tidemark
