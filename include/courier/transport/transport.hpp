#pragma once

/// @file transport.hpp
/// @brief The network I/O collaborator consumed by the request pipeline
///
/// A transport performs exactly one HTTP exchange per call. Connection
/// pooling, TLS and caching are its business; the pipeline only sees the
/// request going in and the body plus metadata coming out.

#include <courier/http/http_message.hpp>
#include <courier/coro/task.hpp>
#include <courier/coro/cancel_token.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>

namespace courier::transport {

/// Body bytes (absent when the exchange carried none) and response metadata
struct transport_result {
    std::optional<std::string> body;
    http::response_metadata metadata;
};

/// Network-level failure: connect, write, read or timeout
/// code() is an errno value such as ECONNREFUSED or ETIMEDOUT.
class transport_error : public std::runtime_error {
public:
    transport_error(int code, const std::string& target)
        : std::runtime_error(target + ": " + std::strerror(code))
        , code_(code)
        , target_(target) {}

    [[nodiscard]] int code() const noexcept { return code_; }
    [[nodiscard]] const std::string& target() const noexcept { return target_; }
    [[nodiscard]] bool is_timeout() const noexcept { return code_ == ETIMEDOUT; }

private:
    int code_;
    std::string target_;
};

/// Session-wide transport settings
struct transport_config {
    std::chrono::milliseconds request_timeout{30000};   ///< Used when a request sets none
    std::string user_agent = "courier/1.0";              ///< Empty = no User-Agent header
    http::headers additional_headers;                    ///< Added unless the request sets them
};

/// Abstract transport
class transport {
public:
    virtual ~transport() = default;

    /// Perform one exchange. Fails with transport_error on network errors and
    /// with coro::operation_cancelled once token is cancelled.
    virtual coro::task<transport_result> perform(http::request request, coro::cancel_token token) = 0;
};

/// Apply session-wide settings to an outgoing request
inline http::request apply_config(const transport_config& config, http::request request) {
    for (const auto& [name, value] : config.additional_headers) {
        request.get_headers().set_if_absent(name, value);
    }
    if (!config.user_agent.empty()) {
        request.get_headers().set_if_absent("User-Agent", config.user_agent);
    }
    if (!request.timeout()) {
        request.set_timeout(config.request_timeout);
    }
    return request;
}

} // namespace courier::transport
