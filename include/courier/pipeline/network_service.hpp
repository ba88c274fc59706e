#pragma once

#include <courier/pipeline/error_handler.hpp>
#include <courier/pipeline/interceptor.hpp>
#include <courier/pipeline/modifier.hpp>
#include <courier/pipeline/validator.hpp>
#include <courier/coro/cancel_token.hpp>
#include <courier/coro/task.hpp>

#include <utility>
#include <vector>

namespace courier::pipeline {

/// Chains attached to a service
///
/// The lists are owned by the service and may be edited between requests.
/// Editing them while requests are in flight is not synchronized.
struct service_config {
    std::vector<request_modifier> request_modifiers;
    std::vector<error_handler> error_handlers;
    std::vector<response_interceptor> response_interceptors;
    bool log_requests = false;   ///< Record typed object calls in request_logger
};

/// The narrow interface the typed request functions are written against
class network_service {
public:
    network_service() = default;
    explicit network_service(service_config config) : config_(std::move(config)) {}
    virtual ~network_service() = default;

    network_service(const network_service&) = delete;
    network_service& operator=(const network_service&) = delete;

    /// Execute a request through the pipeline and return the validated body
    /// and its metadata
    virtual coro::task<raw_response> request_data(http::request request,
                                                  std::vector<response_validator> validators,
                                                  bool apply_modifiers,
                                                  coro::cancel_token token) = 0;

    service_config& config() noexcept { return config_; }
    const service_config& config() const noexcept { return config_; }

    std::vector<request_modifier>& request_modifiers() noexcept { return config_.request_modifiers; }
    std::vector<error_handler>& error_handlers() noexcept { return config_.error_handlers; }
    std::vector<response_interceptor>& response_interceptors() noexcept { return config_.response_interceptors; }

    [[nodiscard]] bool log_requests() const noexcept { return config_.log_requests; }
    void set_log_requests(bool enabled) noexcept { config_.log_requests = enabled; }

protected:
    service_config config_;
};

} // namespace courier::pipeline
