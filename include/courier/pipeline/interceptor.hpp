#pragma once

#include <courier/http/http_message.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace courier::pipeline {

/// Body bytes plus metadata: the result of the core executor
struct raw_response {
    std::string data;
    http::response_metadata metadata;
};

/// Override for successful responses
/// should_handle decides, handle produces the substitute result. Both see
/// the request as the caller described it, before modifiers ran.
struct response_interceptor {
    std::function<bool(std::string_view data, const http::http_response&, const http::request&)> should_handle;
    std::function<raw_response(std::string data, const http::http_response&, const http::request&)> handle;
};

/// First interceptor whose predicate holds, or nullptr
inline const response_interceptor* select_interceptor(const std::vector<response_interceptor>& interceptors,
                                                      std::string_view data,
                                                      const http::http_response& response,
                                                      const http::request& request) {
    for (const auto& interceptor : interceptors) {
        if (interceptor.should_handle(data, response, request)) {
            return &interceptor;
        }
    }
    return nullptr;
}

/// Unwraps `{"<key>": payload, ...}` envelopes into the bare payload
inline response_interceptor json_envelope_interceptor(std::string key) {
    return response_interceptor{
        [key](std::string_view data, const http::http_response& response, const http::request&) {
            if (!http::mime::is_json(response.mime_type())) {
                return false;
            }
            auto doc = nlohmann::json::parse(data, nullptr, false);
            return doc.is_object() && doc.contains(key);
        },
        [key](std::string data, const http::http_response& response, const http::request&) {
            auto doc = nlohmann::json::parse(data);
            return raw_response{doc.at(key).dump(), response};
        },
    };
}

} // namespace courier::pipeline
