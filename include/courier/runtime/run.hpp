#pragma once

#include "run_loop.hpp"
#include <courier/coro/task.hpp>
#include <atomic>
#include <exception>
#include <optional>
#include <type_traits>

namespace courier::runtime {

namespace detail {

/// Outcome of the task driven by run()
template<typename T>
struct completion_slot {
    std::optional<coro::detail::stored_result_t<T>> result;
    std::exception_ptr exception;
    std::atomic<bool> completed{false};

    T take() {
        if (exception) {
            std::rethrow_exception(exception);
        }
        if constexpr (!std::is_void_v<T>) {
            return std::move(*result);
        }
    }
};

template<typename T>
coro::task<void> completion_wrapper(coro::task<T> inner, completion_slot<T>* slot, run_loop* loop) {
    try {
        if constexpr (std::is_void_v<T>) {
            co_await std::move(inner);
            slot->result.emplace(true);
        } else {
            slot->result.emplace(co_await std::move(inner));
        }
    } catch (...) {
        slot->exception = std::current_exception();
    }
    slot->completed.store(true, std::memory_order_release);
    loop->wake();
}

} // namespace detail

/// Drive a task to completion on a fresh run loop owned by the calling thread
///
/// This is the bridge from synchronous code (main(), a test case) into
/// courier coroutines. Exceptions escaping the task are rethrown here.
///
/// @code
/// int main() {
///     auto user = courier::run(request_object<user_info>(service, req));
/// }
/// @endcode
template<typename T>
T run(coro::task<T> task) {
    run_loop loop;
    detail::completion_slot<T> slot;

    auto wrapper = detail::completion_wrapper(std::move(task), &slot, &loop);
    loop.post(wrapper.handle());
    loop.run_until([&] { return slot.completed.load(std::memory_order_acquire); });

    return slot.take();
}

} // namespace courier::runtime

namespace courier {

using runtime::run;

} // namespace courier

/// Define main() around a `coro::task<int> async_main(int argc, char* argv[])`
#define COURIER_ASYNC_MAIN(async_main_func) \
    int main(int argc, char* argv[]) { \
        return courier::run(async_main_func(argc, argv)); \
    }
