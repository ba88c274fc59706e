#pragma once

#include <courier/pipeline/network_error.hpp>
#include <courier/http/http_message.hpp>

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace courier::pipeline {

/// Outcome of a response validator: accept, or the classified failure
using validation_result = std::expected<void, network_error>;

/// Predicate over a completed response. Must not have observable side effects.
using response_validator =
    std::function<validation_result(const http::http_response&, const std::optional<std::string>&)>;

/// Default validator: accepts 2xx and classifies everything else
inline validation_result status_code_is_in_200s(const http::http_response& response,
                                                const std::optional<std::string>& body) {
    const auto code = response.status_code();
    if (code >= 200 && code < 300) {
        return {};
    }
    switch (code) {
        case 401: return std::unexpected(network_error::unauthorized());
        case 403: return std::unexpected(network_error::forbidden());
        case 404: return std::unexpected(network_error::not_found());
        case 405: return std::unexpected(network_error::bad_request());
        default: break;
    }
    if (code >= 500 && code < 600) {
        return std::unexpected(network_error::server_error());
    }
    return std::unexpected(network_error::unexpected_status(code, body));
}

/// Validator accepting status codes in [first, last]
inline response_validator status_code_in(uint16_t first, uint16_t last) {
    return [first, last](const http::http_response& response, const std::optional<std::string>& body)
            -> validation_result {
        if (response.status_code() >= first && response.status_code() <= last) {
            return {};
        }
        return std::unexpected(network_error::unexpected_status(response.status_code(), body));
    };
}

/// The validator list used when a call does not pass one
inline std::vector<response_validator> default_validators() {
    return {status_code_is_in_200s};
}

/// Evaluate validators in order; the first failure wins and later
/// validators are not evaluated
inline validation_result run_validators(const std::vector<response_validator>& validators,
                                        const http::http_response& response,
                                        const std::optional<std::string>& body) {
    for (const auto& validate : validators) {
        if (auto result = validate(response, body); !result) {
            return result;
        }
    }
    return {};
}

} // namespace courier::pipeline
