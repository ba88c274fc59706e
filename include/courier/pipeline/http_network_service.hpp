#pragma once

/// @file http_network_service.hpp
/// @brief Core request executor over a transport
///
/// One attempt runs: modifiers -> transport -> validators -> body check ->
/// interceptor. Attempts are wrapped by safe_request, so a matching error
/// handler gets one chance to recover before the attempt is repeated.

#include <courier/pipeline/network_service.hpp>
#include <courier/transport/transport.hpp>

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace courier::pipeline {

class http_network_service : public network_service {
public:
    explicit http_network_service(std::shared_ptr<transport::transport> transport,
                                  service_config config = {})
        : network_service(std::move(config))
        , transport_(std::move(transport)) {
        if (!transport_) {
            throw std::invalid_argument("http_network_service requires a transport");
        }
    }

    coro::task<raw_response> request_data(http::request request,
                                          std::vector<response_validator> validators,
                                          bool apply_modifiers,
                                          coro::cancel_token token) override {
        auto handlers = config_.error_handlers;
        co_return co_await safe_request<raw_response>(
            std::move(handlers),
            [this, request = std::move(request), validators = std::move(validators),
             apply_modifiers, token]() {
                return execute_once(request, validators, apply_modifiers, token);
            });
    }

    const std::shared_ptr<transport::transport>& get_transport() const noexcept { return transport_; }

private:
    /// The transport call as its own task so it can be spawned
    static coro::task<transport::transport_result> perform_on(std::shared_ptr<transport::transport> transport,
                                                               http::request request,
                                                               coro::cancel_token token) {
        co_return co_await transport->perform(std::move(request), std::move(token));
    }

    coro::task<raw_response> execute_once(http::request original,
                                          std::vector<response_validator> validators,
                                          bool apply_modifiers,
                                          coro::cancel_token token) {
        token.throw_if_cancelled();

        // Modifiers are read on every attempt so recovery can change what goes out
        auto outgoing = apply_modifiers
            ? pipeline::apply_modifiers(config_.request_modifiers, original)
            : original;

        coro::linked_cancel_source child(token);
        auto call = perform_on(transport_, std::move(outgoing), child.get_token()).spawn();
        auto result = co_await call;

        const auto* response = http::as_http_response(result.metadata);
        if (!response) {
            throw network_error::invalid_response_format();
        }

        if (auto verdict = run_validators(validators, *response, result.body); !verdict) {
            throw std::move(verdict).error();
        }

        if (!result.body) {
            throw network_error::no_data_in_response();
        }

        if (const auto* interceptor =
                select_interceptor(config_.response_interceptors, *result.body, *response, original)) {
            co_return interceptor->handle(std::move(*result.body), *response, original);
        }

        co_return raw_response{std::move(*result.body), std::move(result.metadata)};
    }

    std::shared_ptr<transport::transport> transport_;
};

} // namespace courier::pipeline
