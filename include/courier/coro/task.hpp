#pragma once

#include "promise_base.hpp"
#include <courier/runtime/run_loop.hpp>
#include <coroutine>
#include <optional>
#include <exception>
#include <utility>
#include <type_traits>
#include <atomic>
#include <memory>

namespace courier::coro {

template<typename T = void>
class task;

template<typename T = void>
class join_handle;

namespace detail {

struct final_awaiter {
    [[nodiscard]] bool await_ready() const noexcept { return false; }

    template<typename Promise>
    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> h) noexcept {
        auto continuation = h.promise().continuation_;
        if (continuation) {
            return continuation;
        }
        if (h.promise().detached_) {
            // Nobody owns a detached task, so it frees its own frame
            h.destroy();
        }
        return std::noop_coroutine();
    }

    void await_resume() const noexcept {}
};

/// Storage for a spawned task's outcome. void results are kept as a flag.
template<typename T>
using stored_result_t = std::conditional_t<std::is_void_v<T>, bool, T>;

/// State shared between a spawned task and its join_handle.
/// Completion and waiter registration race through waiter_: only the side
/// that takes the handle back out of waiter_ resumes the waiter.
template<typename T>
class join_state {
public:
    template<typename... Args>
    void set_value(Args&&... args) {
        if constexpr (std::is_void_v<T>) {
            value_.emplace(true);
        } else {
            value_.emplace(std::forward<Args>(args)...);
        }
        complete();
    }

    void set_exception(std::exception_ptr ex) {
        exception_ = std::move(ex);
        complete();
    }

    [[nodiscard]] bool is_completed() const noexcept {
        return completed_.load(std::memory_order_acquire);
    }

    /// Returns true if the waiter must stay suspended
    bool set_waiter(std::coroutine_handle<> h) noexcept {
        void* expected = nullptr;
        if (!waiter_.compare_exchange_strong(expected, h.address(),
                std::memory_order_release, std::memory_order_acquire)) {
            return false;
        }
        if (!completed_.load(std::memory_order_acquire)) {
            return true;
        }
        // Completed between the ready check and the registration. Whoever
        // takes the handle back owns the single resume.
        return waiter_.exchange(nullptr, std::memory_order_acq_rel) == nullptr;
    }

    T take() {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
        if constexpr (!std::is_void_v<T>) {
            return std::move(*value_);
        }
    }

private:
    void complete() {
        completed_.store(true, std::memory_order_release);
        if (void* addr = waiter_.exchange(nullptr, std::memory_order_acq_rel)) {
            runtime::schedule_handle(std::coroutine_handle<>::from_address(addr));
        }
    }

    std::optional<stored_result_t<T>> value_;
    std::exception_ptr exception_;
    std::atomic<void*> waiter_{nullptr};
    std::atomic<bool> completed_{false};
};

} // namespace detail

/// Handle to a task started with task<T>::spawn()
/// co_await yields the task's result or rethrows its exception.
template<typename T>
class join_handle {
public:
    explicit join_handle(std::shared_ptr<detail::join_state<T>> state) noexcept
        : state_(std::move(state)) {}

    join_handle(join_handle&&) noexcept = default;
    join_handle& operator=(join_handle&&) noexcept = default;

    join_handle(const join_handle&) = delete;
    join_handle& operator=(const join_handle&) = delete;

    [[nodiscard]] bool await_ready() const noexcept {
        return state_->is_completed();
    }

    bool await_suspend(std::coroutine_handle<> awaiter) noexcept {
        // The awaiter may be resumed and drop this handle before set_waiter returns
        auto state = state_;
        return state->set_waiter(awaiter);
    }

    T await_resume() {
        return state_->take();
    }

    /// Check if the spawned task has completed
    [[nodiscard]] bool is_ready() const noexcept {
        return state_->is_completed();
    }

private:
    std::shared_ptr<detail::join_state<T>> state_;
};

namespace detail {

template<typename T>
struct promise_result {
    std::optional<T> value_;

    template<typename U>
    void return_value(U&& value) {
        value_.emplace(std::forward<U>(value));
    }
};

template<>
struct promise_result<void> {
    void return_void() noexcept {}
};

} // namespace detail

/// Lazily started coroutine returning T
///
/// A task does nothing until it is awaited, spawned or released onto the
/// current run loop. The owner destroys the frame unless it was released.
template<typename T>
class task {
public:
    struct promise_type : promise_base, detail::promise_result<T> {
        std::coroutine_handle<> continuation_;
        bool detached_ = false;

        [[nodiscard]] task get_return_object() noexcept {
            return task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        [[nodiscard]] std::suspend_always initial_suspend() noexcept { return {}; }
        [[nodiscard]] detail::final_awaiter final_suspend() noexcept { return {}; }
    };

    using handle_type = std::coroutine_handle<promise_type>;

    explicit task(handle_type handle) noexcept : handle_(handle) {}
    task(task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    task& operator=(task&& other) noexcept {
        if (this != &other) {
            if (handle_) handle_.destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    ~task() { if (handle_) handle_.destroy(); }

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    [[nodiscard]] handle_type handle() const noexcept { return handle_; }

    [[nodiscard]] handle_type release() noexcept {
        if (handle_) handle_.promise().detached_ = true;
        return std::exchange(handle_, nullptr);
    }

    /// Start this task on the current run loop (fire-and-forget)
    void go() {
        runtime::schedule_handle(release());
    }

    /// Start this task and return a join_handle for its result
    /// Usage: auto h = some_task().spawn(); T result = co_await h;
    [[nodiscard]] join_handle<T> spawn();

    [[nodiscard]] bool await_ready() const noexcept { return false; }

    [[nodiscard]] std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiter) noexcept {
        handle_.promise().continuation_ = awaiter;
        return handle_;
    }

    T await_resume() {
        auto& promise = handle_.promise();
        promise.rethrow_if_failed();
        if constexpr (!std::is_void_v<T>) {
            return std::move(*promise.value_);
        }
    }

private:
    handle_type handle_;
};

namespace detail {

/// Runs t to completion and publishes the outcome to state
template<typename T>
task<void> join_wrapper(task<T> t, std::shared_ptr<join_state<T>> state) {
    try {
        if constexpr (std::is_void_v<T>) {
            co_await std::move(t);
            state->set_value();
        } else {
            state->set_value(co_await std::move(t));
        }
    } catch (...) {
        state->set_exception(std::current_exception());
    }
}

} // namespace detail

template<typename T>
join_handle<T> task<T>::spawn() {
    auto state = std::make_shared<detail::join_state<T>>();
    detail::join_wrapper(std::move(*this), state).go();
    return join_handle<T>(std::move(state));
}

} // namespace courier::coro
