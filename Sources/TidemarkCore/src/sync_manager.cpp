#include "tidemark/sync_manager.hpp"
#include "tidemark/log.hpp"
#include <algorithm>
#include <chrono>

namespace tidemark {

const char* to_string(manager_state state) {
    switch (state) {
        case manager_state::idle: return "idle";
        case manager_state::syncing: return "syncing";
        case manager_state::error: return "error";
    }
    return "";
}

int64_t compute_next_delay(const sync_result& result, int consecutive_errors, int64_t base_interval_ms,
                           double jitter) {
    int64_t delay = base_interval_ms;
    if (!result.ok) {
        int exponent = std::min(4, std::max(0, consecutive_errors - 1));
        int64_t backoff = std::min<int64_t>(10 * 60 * 1000, 30000LL << exponent);
        delay = std::max<int64_t>(30000, backoff);
    } else if (result.pulled + result.pushed > 0) {
        delay = std::min<int64_t>(45000, std::max<int64_t>(15000, base_interval_ms / 3));
    }
    delay += static_cast<int64_t>(static_cast<double>(delay) * 0.15 * jitter);
    return std::max(min_auto_delay_ms, delay);
}

sync_manager::sync_manager(sync_engine& engine) : engine_(engine) {}

sync_manager::~sync_manager() {
    stop_auto();
}

sync_result sync_manager::run_once(const sync_options& options) {
    bool expected = false;
    if (!in_flight_.compare_exchange_strong(expected, true)) {
        sync_result busy;
        busy.error = "sync busy";
        return busy;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = manager_state::syncing;
        last_error_.reset();
    }

    auto result = engine_.run_sync(options);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_result_ = result;
        last_sync_at_ = now_ms();
        state_ = result.ok ? manager_state::idle : manager_state::error;
        if (!result.ok) last_error_ = result.error.value_or("unknown");
    }
    in_flight_.store(false);
    return result;
}

manager_status sync_manager::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    manager_status s;
    s.state = state_;
    s.last_sync_at = last_sync_at_;
    s.last_error = last_error_;
    s.last_result = last_result_;
    if (next_at_) s.next_auto_sync_in_ms = std::max<int64_t>(0, *next_at_ - now_ms());
    return s;
}

void sync_manager::start_auto(int64_t interval_ms) {
    stop_auto();
    const int64_t base = std::max(min_auto_delay_ms, interval_ms > 0 ? interval_ms : default_auto_interval_ms);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    worker_ = std::thread([this, base] { auto_loop(base); });
}

void sync_manager::stop_auto() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        next_at_.reset();
    }
    wake_.notify_all();
    if (worker_.joinable()) worker_.join();
}

bool sync_manager::auto_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_.joinable() && !stop_requested_;
}

void sync_manager::auto_loop(int64_t base_interval_ms) {
    std::uniform_real_distribution<double> jitter(0.0, 1.0);
    int64_t delay = base_interval_ms;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            next_at_ = now_ms() + delay;
            if (wake_.wait_for(lock, std::chrono::milliseconds(delay), [this] { return stop_requested_; })) {
                next_at_.reset();
                return;
            }
            next_at_.reset();
        }

        sync_options options;
        options.started_at = now_ms();
        auto result = run_once(options);
        if (result.error && *result.error == "sync busy") {
            delay = base_interval_ms;
            continue;
        }

        int errors = 0;
        double j = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            consecutive_errors_ = result.ok ? 0 : consecutive_errors_ + 1;
            errors = consecutive_errors_;
            j = jitter(rng_);
        }
        delay = compute_next_delay(result, errors, base_interval_ms, j);
        LOG_DEBUG("sync", "Next automatic sync in %lldms", static_cast<long long>(delay));
    }
}

} // namespace tidemark
