#pragma once

#include <courier/pipeline/network_error.hpp>
#include <courier/coro/task.hpp>

#include <algorithm>
#include <exception>
#include <functional>
#include <vector>

namespace courier::pipeline {

/// Recovery step for a failed request
/// When can_handle matches, handle runs (it may suspend, e.g. to refresh a
/// credential) and the failed request is then issued once more.
struct error_handler {
    std::function<bool(const std::exception_ptr&)> can_handle;
    std::function<coro::task<void>(std::exception_ptr)> handle;
};

/// Predicate matching network_error of one kind
inline std::function<bool(const std::exception_ptr&)> handles(error_kind kind) {
    return [kind](const std::exception_ptr& ep) { return is_network_error(ep, kind); };
}

/// Run work, recovering at most once
///
/// On failure the first handler whose predicate matches performs its
/// recovery and work runs a second time; that second outcome is returned as
/// is, even when it fails for the same reason. Without a matching handler the
/// original exception is rethrown unchanged. A failing recovery reports its
/// own exception and is not offered to the handlers again.
template<typename T, typename Work>
coro::task<T> safe_request(std::vector<error_handler> handlers, Work work) {
    std::exception_ptr failure;
    try {
        co_return co_await work();
    } catch (...) {
        failure = std::current_exception();
    }

    auto it = std::find_if(handlers.begin(), handlers.end(),
                           [&](const error_handler& h) { return h.can_handle(failure); });
    if (it == handlers.end()) {
        std::rethrow_exception(failure);
    }

    co_await it->handle(failure);
    co_return co_await work();
}

} // namespace courier::pipeline
