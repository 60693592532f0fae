#pragma once

#include <functional>
#include <memory>
#include <thread>
#include <mutex>
#include <deque>
#include <condition_variable>
#include <atomic>

namespace tidemark {

// ============================================================================
// Scheduler interface - where progress callbacks are delivered
// ============================================================================
//
// The sync pipeline runs on the caller's thread. Observers that must run on
// a UI thread or an actor hand the engine a scheduler for their own context,
// and every progress event is posted through it.

struct scheduler {
    virtual ~scheduler() = default;

    // Posts a task. Safe from any thread.
    virtual void invoke(std::function<void()>&& fn) = 0;

    // True when called from the context tasks run on.
    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;

    // False once the scheduler stopped accepting tasks.
    [[nodiscard]] virtual bool can_invoke() const noexcept = 0;
};

using shared_scheduler = std::shared_ptr<scheduler>;

// ============================================================================
// std_thread_scheduler - one worker thread, FIFO
// ============================================================================

class std_thread_scheduler : public scheduler {
public:
    std_thread_scheduler() : worker_([this] { drain(); }) {}

    ~std_thread_scheduler() override {
        {
            std::lock_guard<std::mutex> guard(lock_);
            stopping_ = true;
        }
        wake_.notify_one();
        if (worker_.joinable()) worker_.join();
    }

    std_thread_scheduler(const std_thread_scheduler&) = delete;
    std_thread_scheduler& operator=(const std_thread_scheduler&) = delete;

    void invoke(std::function<void()>&& fn) override {
        if (!fn) return;
        {
            std::lock_guard<std::mutex> guard(lock_);
            if (stopping_) return;
            tasks_.push_back(std::move(fn));
        }
        wake_.notify_one();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == worker_.get_id();
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return !stopping_.load();
    }

private:
    // Tasks queued before shutdown still run
    void drain() {
        std::unique_lock<std::mutex> guard(lock_);
        for (;;) {
            wake_.wait(guard, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) return;

            auto next = std::move(tasks_.front());
            tasks_.pop_front();
            guard.unlock();
            next();
            guard.lock();
        }
    }

    std::mutex lock_;
    std::condition_variable wake_;
    std::deque<std::function<void()>> tasks_;
    std::atomic<bool> stopping_{false};
    std::thread worker_;
};

// ============================================================================
// immediate_scheduler - runs tasks inline on the posting thread
// ============================================================================

class immediate_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        if (fn) fn();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override { return true; }
    [[nodiscard]] bool can_invoke() const noexcept override { return true; }
};

} // namespace tidemark
