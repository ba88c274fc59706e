#pragma once

#include <courier/transport/transport.hpp>
#include <courier/runtime/blocking.hpp>
#include <courier/log/macros.hpp>

#include <functional>
#include <utility>

namespace courier::transport {

/// Transport over a synchronous perform function
///
/// Wraps any blocking HTTP client (libcurl easy handle, a test double, a
/// file reader) so it can be awaited from the pipeline. Each call runs on its
/// own thread via runtime::spawn_blocking; the function receives the
/// cancellation token and should abandon the exchange once it fires.
class blocking_transport : public transport {
public:
    using perform_fn = std::function<transport_result(const http::request&, const coro::cancel_token&)>;

    blocking_transport(transport_config config, perform_fn fn)
        : config_(std::move(config)), fn_(std::move(fn)) {}

    coro::task<transport_result> perform(http::request request, coro::cancel_token token) override {
        token.throw_if_cancelled();

        auto prepared = apply_config(config_, std::move(request));
        COURIER_LOG_DEBUG("{} {}", http::method_to_string(prepared.get_method()), prepared.target());

        co_return co_await runtime::spawn_blocking(
            [fn = fn_, prepared = std::move(prepared), token]() {
                return fn(prepared, token);
            },
            token);
    }

    const transport_config& config() const noexcept { return config_; }

private:
    transport_config config_;
    perform_fn fn_;
};

} // namespace courier::transport
