#pragma once

#include "run_loop.hpp"
#include <courier/coro/cancel_token.hpp>
#include <courier/log/macros.hpp>
#include <atomic>
#include <coroutine>
#include <exception>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

namespace courier::runtime {

namespace detail {

template<typename T>
struct blocking_state {
    std::optional<std::conditional_t<std::is_void_v<T>, bool, T>> value;
    std::exception_ptr exception;
    std::coroutine_handle<> awaiter;
    run_loop* loop = nullptr;
    std::atomic<bool> claimed{false};
    std::atomic<int> phase{suspending};
    bool cancelled = false;

    static constexpr int suspending = 0;
    static constexpr int armed = 1;
    static constexpr int cancelled_early = 2;

    /// First caller wins the right to resume the awaiter
    bool claim() noexcept {
        return !claimed.exchange(true, std::memory_order_acq_rel);
    }

    void resume_awaiter() {
        if (loop) {
            loop->post(awaiter);
        } else {
            awaiter.resume();
        }
    }
};

} // namespace detail

/// Awaitable running a blocking callable on its own thread
///
/// The awaiting coroutine is resumed on the run loop it suspended from. If
/// the token is cancelled first, the awaiter resumes immediately with
/// operation_cancelled; the callable keeps running to completion in the
/// background and its result is discarded. The callable should watch the
/// token itself to stop early.
template<typename F>
class blocking_awaitable {
public:
    using result_type = std::invoke_result_t<F&>;

    blocking_awaitable(F fn, coro::cancel_token token)
        : fn_(std::move(fn))
        , token_(std::move(token))
        , state_(std::make_shared<detail::blocking_state<result_type>>()) {}

    [[nodiscard]] bool await_ready() const noexcept {
        return token_.is_cancelled();
    }

    bool await_suspend(std::coroutine_handle<> awaiter) {
        state_->awaiter = awaiter;
        state_->loop = run_loop::current();

        using state_type = detail::blocking_state<result_type>;
        registration_ = token_.on_cancel([state = state_]() {
            if (!state->claim()) {
                return;
            }
            state->cancelled = true;
            int expected = state_type::suspending;
            if (!state->phase.compare_exchange_strong(expected, state_type::cancelled_early,
                                                      std::memory_order_acq_rel)) {
                state->resume_awaiter();
            }
        });

        int expected = state_type::suspending;
        if (!state_->phase.compare_exchange_strong(expected, state_type::armed,
                                                   std::memory_order_acq_rel)) {
            // Cancelled while registering; resume without suspending
            return false;
        }

        // Nothing of *this may be touched once the thread is running
        std::thread([state = state_, fn = std::move(fn_)]() mutable {
            try {
                if constexpr (std::is_void_v<result_type>) {
                    fn();
                    state->value.emplace(true);
                } else {
                    state->value.emplace(fn());
                }
            } catch (...) {
                state->exception = std::current_exception();
            }
            if (state->claim()) {
                state->resume_awaiter();
            } else {
                COURIER_LOG_DEBUG("blocking call finished after cancellation, result dropped");
            }
        }).detach();
        return true;
    }

    result_type await_resume() {
        registration_.unregister();
        if (state_->cancelled || (!state_->value && !state_->exception)) {
            throw coro::operation_cancelled();
        }
        if (state_->exception) {
            std::rethrow_exception(state_->exception);
        }
        if constexpr (!std::is_void_v<result_type>) {
            return std::move(*state_->value);
        }
    }

private:
    F fn_;
    coro::cancel_token token_;
    std::shared_ptr<detail::blocking_state<result_type>> state_;
    coro::cancel_registration registration_;
};

/// Run fn() off the run loop and await its result
/// @code
/// auto body = co_await runtime::spawn_blocking([&] { return read_file(path); }, token);
/// @endcode
template<typename F>
[[nodiscard]] blocking_awaitable<std::decay_t<F>> spawn_blocking(F&& fn, coro::cancel_token token = {}) {
    return blocking_awaitable<std::decay_t<F>>(std::forward<F>(fn), std::move(token));
}

} // namespace courier::runtime
