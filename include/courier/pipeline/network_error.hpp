#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace courier::pipeline {

/// Classification of pipeline failures
enum class error_kind : uint8_t {
    invalid_response_format,
    decoding,
    decoding_string,
    no_data_in_response,
    bad_request,
    unauthorized,
    forbidden,
    not_found,
    timeout,
    server_error,
    other,
    unexpected_status,
};

inline const char* error_kind_str(error_kind kind) noexcept {
    switch (kind) {
        case error_kind::invalid_response_format: return "invalid response format";
        case error_kind::decoding: return "decoding failed";
        case error_kind::decoding_string: return "string decoding failed";
        case error_kind::no_data_in_response: return "no data in response";
        case error_kind::bad_request: return "bad request";
        case error_kind::unauthorized: return "unauthorized";
        case error_kind::forbidden: return "forbidden";
        case error_kind::not_found: return "not found";
        case error_kind::timeout: return "timeout";
        case error_kind::server_error: return "server error";
        case error_kind::other: return "other";
        case error_kind::unexpected_status: return "unexpected status code";
        default: return "unknown error";
    }
}

/// Failure raised by the request pipeline
///
/// Status-derived kinds carry an optional context string. `decoding` keeps
/// the decoder's exception as its cause; `unexpected_status` keeps the
/// status code and the response body for diagnostics.
class network_error : public std::runtime_error {
public:
    static network_error invalid_response_format() { return network_error(error_kind::invalid_response_format); }
    static network_error decoding_string() { return network_error(error_kind::decoding_string); }
    static network_error no_data_in_response() { return network_error(error_kind::no_data_in_response); }

    static network_error bad_request(std::optional<std::string> context = std::nullopt) {
        return network_error(error_kind::bad_request, std::move(context));
    }
    static network_error unauthorized(std::optional<std::string> context = std::nullopt) {
        return network_error(error_kind::unauthorized, std::move(context));
    }
    static network_error forbidden(std::optional<std::string> context = std::nullopt) {
        return network_error(error_kind::forbidden, std::move(context));
    }
    static network_error not_found(std::optional<std::string> context = std::nullopt) {
        return network_error(error_kind::not_found, std::move(context));
    }
    static network_error timeout(std::optional<std::string> context = std::nullopt) {
        return network_error(error_kind::timeout, std::move(context));
    }
    static network_error server_error(std::optional<std::string> context = std::nullopt) {
        return network_error(error_kind::server_error, std::move(context));
    }
    static network_error other(std::optional<std::string> context = std::nullopt) {
        return network_error(error_kind::other, std::move(context));
    }

    /// Wrap a decoder failure. `cause` is rethrowable; `message` is its what().
    static network_error decoding(std::exception_ptr cause, std::string message) {
        network_error err(error_kind::decoding, std::move(message));
        err.cause_ = std::move(cause);
        return err;
    }

    static network_error unexpected_status(uint16_t status_code, std::optional<std::string> body) {
        network_error err(error_kind::unexpected_status, fmt::format("HTTP {}", status_code));
        err.status_code_ = status_code;
        err.body_ = std::move(body);
        return err;
    }

    [[nodiscard]] error_kind kind() const noexcept { return kind_; }

    /// Human-readable context (for decoding: the decoder's message)
    [[nodiscard]] const std::optional<std::string>& context() const noexcept { return context_; }

    /// Status code of an unexpected_status error, 0 otherwise
    [[nodiscard]] uint16_t status_code() const noexcept { return status_code_; }

    /// Response body of an unexpected_status error
    [[nodiscard]] const std::optional<std::string>& body() const noexcept { return body_; }

    /// The decoder exception of a decoding error
    [[nodiscard]] const std::exception_ptr& cause() const noexcept { return cause_; }

    friend bool operator==(const network_error& a, const network_error& b) {
        if (a.kind_ != b.kind_) {
            return false;
        }
        switch (a.kind_) {
            case error_kind::decoding:
                return a.cause_ == b.cause_ || a.context_ == b.context_;
            case error_kind::unexpected_status:
                return a.status_code_ == b.status_code_ && a.body_ == b.body_;
            default:
                return a.context_ == b.context_;
        }
    }

private:
    explicit network_error(error_kind kind, std::optional<std::string> context = std::nullopt)
        : std::runtime_error(describe(kind, context))
        , kind_(kind)
        , context_(std::move(context)) {}

    static std::string describe(error_kind kind, const std::optional<std::string>& context) {
        if (context) {
            return fmt::format("{}: {}", error_kind_str(kind), *context);
        }
        return error_kind_str(kind);
    }

    error_kind kind_;
    std::optional<std::string> context_;
    uint16_t status_code_ = 0;
    std::optional<std::string> body_;
    std::exception_ptr cause_;
};

/// True when ep holds a network_error of the given kind
inline bool is_network_error(const std::exception_ptr& ep, error_kind kind) {
    if (!ep) {
        return false;
    }
    try {
        std::rethrow_exception(ep);
    } catch (const network_error& e) {
        return e.kind() == kind;
    } catch (...) {
        // Any other exception type is simply not this kind
    }
    return false;
}

} // namespace courier::pipeline
