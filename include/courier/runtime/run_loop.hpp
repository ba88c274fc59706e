#pragma once

#include <courier/log/macros.hpp>
#include <condition_variable>
#include <coroutine>
#include <deque>
#include <functional>
#include <mutex>
#include <utility>

namespace courier::runtime {

/// Single-threaded cooperative executor
///
/// Coroutines posted to a run_loop are resumed one at a time, in FIFO order,
/// on the thread that drives the loop. post() may be called from any thread;
/// that is how blocking work finishing elsewhere hands its continuation back.
class run_loop {
public:
    run_loop() = default;

    ~run_loop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!queue_.empty()) {
            COURIER_LOG_WARNING("run_loop destroyed with {} pending coroutine(s)", queue_.size());
        }
    }

    run_loop(const run_loop&) = delete;
    run_loop& operator=(const run_loop&) = delete;
    run_loop(run_loop&&) = delete;
    run_loop& operator=(run_loop&&) = delete;

    /// Queue a coroutine for resumption. Thread-safe.
    void post(std::coroutine_handle<> handle) {
        if (!handle) [[unlikely]] return;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(handle);
        }
        cv_.notify_one();
    }

    /// Wake a thread blocked in run_until() so it re-checks its predicate
    void wake() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
        }
        cv_.notify_all();
    }

    /// Resume every queued coroutine until done() holds
    /// Blocks while the queue is empty and done() is false.
    void run_until(const std::function<bool()>& done) {
        scope guard(this);
        for (;;) {
            std::coroutine_handle<> next;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [&] { return !queue_.empty() || done(); });
                if (queue_.empty()) {
                    return;
                }
                next = queue_.front();
                queue_.pop_front();
            }
            if (!next.done()) {
                next.resume();
            }
        }
    }

    /// The loop driving the calling thread, or nullptr
    [[nodiscard]] static run_loop* current() noexcept {
        return current_loop_;
    }

private:
    /// Marks a loop as current for the calling thread while it is driven
    class scope {
    public:
        explicit scope(run_loop* loop) noexcept
            : previous_(std::exchange(current_loop_, loop)) {}
        ~scope() { current_loop_ = previous_; }

        scope(const scope&) = delete;
        scope& operator=(const scope&) = delete;

    private:
        run_loop* previous_;
    };

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::coroutine_handle<>> queue_;

    static inline thread_local run_loop* current_loop_ = nullptr;
};

/// Hand a coroutine to the current thread's run loop
/// Without a loop the coroutine is resumed inline.
inline void schedule_handle(std::coroutine_handle<> handle) {
    if (!handle) return;

    if (auto* loop = run_loop::current()) {
        loop->post(handle);
    } else if (!handle.done()) {
        handle.resume();
    }
}

/// Awaitable that requeues the awaiting coroutine behind other ready work
class yield_awaitable {
public:
    [[nodiscard]] bool await_ready() const noexcept {
        return run_loop::current() == nullptr;
    }

    void await_suspend(std::coroutine_handle<> awaiter) {
        run_loop::current()->post(awaiter);
    }

    void await_resume() const noexcept {}
};

[[nodiscard]] inline yield_awaitable yield() noexcept {
    return {};
}

} // namespace courier::runtime
