#pragma once

#include <courier/http/http_message.hpp>

#include <fmt/format.h>

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace courier::pipeline {

/// Pure transformation of an outgoing request
using request_modifier = std::function<http::request(http::request)>;

/// Fold modifiers over a request, left to right
inline http::request apply_modifiers(const std::vector<request_modifier>& modifiers, http::request request) {
    for (const auto& modify : modifiers) {
        request = modify(std::move(request));
    }
    return request;
}

/// Several modifiers behaving as one
inline request_modifier composite_modifier(std::vector<request_modifier> modifiers) {
    return [modifiers = std::move(modifiers)](http::request request) {
        return apply_modifiers(modifiers, std::move(request));
    };
}

/// Sets a header, overwriting earlier values: the last modifier to write wins
inline request_modifier set_header(std::string name, std::string value) {
    return [name = std::move(name), value = std::move(value)](http::request request) {
        request.set_header(name, value);
        return request;
    };
}

/// Adds `Authorization: Bearer <token>`; the provider is asked on every
/// attempt so a retry after a credential refresh carries the new token
inline request_modifier bearer_token(std::function<std::string()> provider) {
    return [provider = std::move(provider)](http::request request) {
        auto token = provider();
        if (!token.empty()) {
            request.set_header("Authorization", fmt::format("Bearer {}", token));
        }
        return request;
    };
}

} // namespace courier::pipeline
