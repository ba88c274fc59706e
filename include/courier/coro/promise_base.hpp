#pragma once

#include <exception>

namespace courier::coro {

/// Base class for courier promise types
/// Captures the exception that escaped the coroutine body so the awaiting
/// side can rethrow it from await_resume().
class promise_base {
public:
    promise_base() noexcept = default;
    ~promise_base() = default;

    promise_base(const promise_base&) = delete;
    promise_base& operator=(const promise_base&) = delete;
    promise_base(promise_base&&) = delete;
    promise_base& operator=(promise_base&&) = delete;

    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
    }

    [[nodiscard]] std::exception_ptr exception() const noexcept {
        return exception_;
    }

    /// Rethrow the captured exception, if any
    void rethrow_if_failed() const {
        if (exception_) {
            std::rethrow_exception(exception_);
        }
    }

private:
    std::exception_ptr exception_;
};

} // namespace courier::coro
