#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace courier::coro {

/// Thrown by operations that observe a cancelled token
class operation_cancelled : public std::runtime_error {
public:
    operation_cancelled()
        : std::runtime_error("operation cancelled") {}

    explicit operation_cancelled(const std::string& what)
        : std::runtime_error(what) {}
};

namespace detail {

/// Cancellation state shared by a source and all of its tokens
class cancel_state {
public:
    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// Returns 0 when the callback already ran because cancellation happened first
    uint64_t add_callback(std::function<void()> cb) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!cancelled_.load(std::memory_order_relaxed)) {
                uint64_t id = next_id_++;
                callbacks_.emplace_back(id, std::move(cb));
                return id;
            }
        }
        cb();
        return 0;
    }

    void remove_callback(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::erase_if(callbacks_, [id](const auto& entry) { return entry.first == id; });
    }

    void trigger() {
        std::vector<std::pair<uint64_t, std::function<void()>>> to_invoke;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
                return;
            }
            to_invoke.swap(callbacks_);
        }
        // Callbacks run outside the lock so they may register or unregister freely
        for (auto& [id, cb] : to_invoke) {
            cb();
        }
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::vector<std::pair<uint64_t, std::function<void()>>> callbacks_;
    uint64_t next_id_ = 1;
};

} // namespace detail

/// RAII handle for a callback registered with cancel_token::on_cancel()
/// Destroying the registration unregisters the callback.
class cancel_registration {
public:
    cancel_registration() = default;

    cancel_registration(cancel_registration&& other) noexcept
        : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}

    cancel_registration& operator=(cancel_registration&& other) noexcept {
        if (this != &other) {
            unregister();
            state_ = std::move(other.state_);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    ~cancel_registration() { unregister(); }

    cancel_registration(const cancel_registration&) = delete;
    cancel_registration& operator=(const cancel_registration&) = delete;

    void unregister() {
        if (state_ && id_ != 0) {
            state_->remove_callback(id_);
        }
        id_ = 0;
        state_.reset();
    }

private:
    friend class cancel_token;

    cancel_registration(std::shared_ptr<detail::cancel_state> state, uint64_t id)
        : state_(std::move(state)), id_(id) {}

    std::shared_ptr<detail::cancel_state> state_;
    uint64_t id_ = 0;
};

/// Observer side of a cancellation request
///
/// Tokens are cheap to copy and are passed by value into cancellable
/// operations. A default-constructed token is never cancelled.
///
/// Example:
/// ```cpp
/// task<std::string> fetch(cancel_token token) {
///     token.throw_if_cancelled();
///     auto reg = token.on_cancel([&] { abort_io(); });
///     co_return co_await do_io();
/// }
/// ```
class cancel_token {
public:
    using registration = cancel_registration;

    cancel_token() = default;

    [[nodiscard]] bool is_cancelled() const noexcept {
        return state_ && state_->is_cancelled();
    }

    /// True when the token can ever be cancelled
    [[nodiscard]] bool can_be_cancelled() const noexcept {
        return state_ != nullptr;
    }

    /// Throws operation_cancelled if cancellation was requested
    void throw_if_cancelled() const {
        if (is_cancelled()) {
            throw operation_cancelled();
        }
    }

    /// Register a callback invoked once on cancellation.
    /// Runs immediately on the calling thread if already cancelled.
    template<typename F>
    [[nodiscard]] registration on_cancel(F&& callback) const {
        if (!state_) {
            return registration{};
        }
        return registration{state_, state_->add_callback(std::forward<F>(callback))};
    }

private:
    friend class cancel_source;

    explicit cancel_token(std::shared_ptr<detail::cancel_state> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::cancel_state> state_;
};

/// Owner side of a cancellation request
class cancel_source {
public:
    cancel_source()
        : state_(std::make_shared<detail::cancel_state>()) {}

    [[nodiscard]] cancel_token get_token() const noexcept {
        return cancel_token{state_};
    }

    /// Cancel every token of this source and run their callbacks
    void cancel() {
        state_->trigger();
    }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return state_->is_cancelled();
    }

private:
    std::shared_ptr<detail::cancel_state> state_;
};

/// A cancel_source that follows a parent token
/// Cancelling the parent cancels this source; cancelling this source leaves
/// the parent untouched.
class linked_cancel_source {
public:
    explicit linked_cancel_source(const cancel_token& parent)
        : registration_(parent.on_cancel([state = source_]() mutable { state.cancel(); })) {}

    linked_cancel_source(const linked_cancel_source&) = delete;
    linked_cancel_source& operator=(const linked_cancel_source&) = delete;

    [[nodiscard]] cancel_token get_token() const noexcept { return source_.get_token(); }
    void cancel() { source_.cancel(); }
    [[nodiscard]] bool is_cancelled() const noexcept { return source_.is_cancelled(); }

private:
    cancel_source source_;
    cancel_registration registration_;
};

} // namespace courier::coro
