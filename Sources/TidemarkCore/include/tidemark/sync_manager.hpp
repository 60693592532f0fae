#pragma once

#ifdef __cplusplus

#include "sync.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>

namespace tidemark {

enum class manager_state { idle, syncing, error };

const char* to_string(manager_state state);

struct manager_status {
    manager_state state = manager_state::idle;
    std::optional<epoch_ms_t> last_sync_at;
    std::optional<std::string> last_error;
    std::optional<sync_result> last_result;
    std::optional<int64_t> next_auto_sync_in_ms;
};

inline constexpr int64_t default_auto_interval_ms = 5 * 60 * 1000;
inline constexpr int64_t min_auto_delay_ms = 10 * 1000;

/// Delay before the next automatic run.
/// failure:  max(30 s, min(10 min, 30 s * 2^min(4, errors - 1)))
/// activity: min(45 s, max(15 s, base / 3))
/// idle:     base
/// plus delay * 0.15 * jitter (jitter in [0, 1)), never below 10 s.
int64_t compute_next_delay(const sync_result& result, int consecutive_errors, int64_t base_interval_ms,
                           double jitter);

// ============================================================================
// sync_manager - single in-flight run plus an optional background loop
// ============================================================================

class sync_manager {
public:
    explicit sync_manager(sync_engine& engine);
    ~sync_manager();

    sync_manager(const sync_manager&) = delete;
    sync_manager& operator=(const sync_manager&) = delete;

    /// Runs one sync on the calling thread. A call made while another run is
    /// in flight returns immediately with error "sync busy".
    sync_result run_once(const sync_options& options = {});

    manager_status status() const;

    /// Starts (or restarts) the background loop; the first run waits one interval
    void start_auto(int64_t interval_ms);
    void stop_auto();
    bool auto_running() const;

private:
    void auto_loop(int64_t base_interval_ms);

    sync_engine& engine_;
    std::atomic<bool> in_flight_{false};

    mutable std::mutex mutex_;
    manager_state state_ = manager_state::idle;
    std::optional<epoch_ms_t> last_sync_at_;
    std::optional<std::string> last_error_;
    std::optional<sync_result> last_result_;
    std::optional<epoch_ms_t> next_at_;
    int consecutive_errors_ = 0;

    std::thread worker_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
    std::mt19937_64 rng_{std::random_device{}()};
};

} // namespace tidemark

#endif // __cplusplus
