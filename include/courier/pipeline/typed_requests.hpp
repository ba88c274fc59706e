#pragma once

/// @file typed_requests.hpp
/// @brief Typed operations written once against network_service
///
/// Each function runs request_data and then decodes or transforms the bytes.
/// Decode failures are reported as network_error and are never retried.
///
/// @code
/// auto user = co_await request_object<user_info>(service, http::request{http::method::GET, url});
/// @endcode

#include <courier/pipeline/decoder.hpp>
#include <courier/pipeline/network_service.hpp>
#include <courier/pipeline/request_logger.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <any>
#include <exception>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

namespace courier::pipeline {

/// One candidate decoding for request_with_multiple_response_types
struct response_shape {
    std::string name;
    std::function<std::any(const std::string&)> decode;

    /// Decode the body as JSON into T
    template<typename T>
    static response_shape object(std::string name = "object",
                                 json_decoder decoder = default_json_decoder()) {
        return response_shape{
            std::move(name),
            [decoder = std::move(decoder)](const std::string& data) -> std::any {
                return decoder.template decode<T>(data);
            },
        };
    }

    /// Accept the body as UTF-8 text
    static response_shape string(std::string name = "string") {
        return response_shape{
            std::move(name),
            [](const std::string& data) -> std::any {
                auto text = decode_string(data, string_encoding::utf8);
                if (!text) {
                    throw network_error::decoding_string();
                }
                return std::move(*text);
            },
        };
    }
};

/// The first shape that decoded, and its value
struct matched_response {
    size_t shape_index = 0;
    std::string shape_name;
    std::any value;

    template<typename T>
    [[nodiscard]] const T& get() const { return std::any_cast<const T&>(value); }

    template<typename T>
    [[nodiscard]] bool holds() const noexcept { return value.type() == typeid(T); }
};

namespace detail {

template<typename T>
T decode_or_throw(const json_decoder& decoder, const std::string& data) {
    try {
        return decoder.template decode<T>(data);
    } catch (const std::exception& e) {
        throw network_error::decoding(std::current_exception(), e.what());
    } catch (...) {
        throw network_error::decoding(std::current_exception(), "decoder failed with a non-standard exception");
    }
}

inline std::string decode_text_or_throw(const std::string& data, string_encoding encoding) {
    auto text = decode_string(data, encoding);
    if (!text) {
        throw network_error::decoding_string();
    }
    return std::move(*text);
}

inline void write_log(http::request request, std::optional<std::string> data, bool success) {
    request_logger::instance().log(request_log{std::move(request), std::move(data), success});
}

/// request_data, writing a failure record when logging is on
inline coro::task<raw_response> logged_request_data(network_service& service,
                                                    http::request request,
                                                    std::vector<response_validator> validators,
                                                    bool apply_modifiers,
                                                    coro::cancel_token token,
                                                    bool logging) {
    if (!logging) {
        co_return co_await service.request_data(std::move(request), std::move(validators),
                                                apply_modifiers, std::move(token));
    }
    try {
        co_return co_await service.request_data(request, std::move(validators),
                                                apply_modifiers, std::move(token));
    } catch (...) {
        write_log(std::move(request), std::nullopt, false);
        throw;
    }
}

} // namespace detail

/// Decode the body as one JSON value of T
template<typename T, http::request_convertible Description>
coro::task<T> request_object(network_service& service,
                             Description description,
                             std::vector<response_validator> validators = default_validators(),
                             json_decoder decoder = default_json_decoder(),
                             bool apply_modifiers = true,
                             coro::cancel_token token = {}) {
    http::request request = description.to_request();
    const bool logging = service.log_requests();

    auto raw = co_await detail::logged_request_data(service, request, std::move(validators),
                                                    apply_modifiers, std::move(token), logging);
    try {
        T value = detail::decode_or_throw<T>(decoder, raw.data);
        if (logging) {
            detail::write_log(std::move(request), std::move(raw.data), true);
        }
        co_return value;
    } catch (const network_error&) {
        if (logging) {
            detail::write_log(std::move(request), std::move(raw.data), false);
        }
        throw;
    }
}

/// Decode the body as a JSON array of T
template<typename T, http::request_convertible Description>
coro::task<std::vector<T>> request_objects(network_service& service,
                                           Description description,
                                           std::vector<response_validator> validators = default_validators(),
                                           json_decoder decoder = default_json_decoder(),
                                           bool apply_modifiers = true,
                                           coro::cancel_token token = {}) {
    auto raw = co_await service.request_data(description.to_request(), std::move(validators),
                                             apply_modifiers, std::move(token));
    co_return detail::decode_or_throw<std::vector<T>>(decoder, raw.data);
}

/// The body as text, transcoded to UTF-8
template<http::request_convertible Description>
coro::task<std::string> request_string(network_service& service,
                                       Description description,
                                       string_encoding encoding = string_encoding::utf8,
                                       std::vector<response_validator> validators = default_validators(),
                                       bool apply_modifiers = true,
                                       coro::cancel_token token = {}) {
    auto raw = co_await service.request_data(description.to_request(), std::move(validators),
                                             apply_modifiers, std::move(token));
    co_return detail::decode_text_or_throw(raw.data, encoding);
}

/// Run the request for its side effects only
template<http::request_convertible Description>
coro::task<void> request_void(network_service& service,
                              Description description,
                              std::vector<response_validator> validators = default_validators(),
                              bool apply_modifiers = true,
                              coro::cancel_token token = {}) {
    co_await service.request_data(description.to_request(), std::move(validators),
                                  apply_modifiers, std::move(token));
}

/// request_string plus the response metadata
template<http::request_convertible Description>
coro::task<std::pair<std::string, http::response_metadata>>
request_string_with_response(network_service& service,
                             Description description,
                             string_encoding encoding = string_encoding::utf8,
                             std::vector<response_validator> validators = default_validators(),
                             bool apply_modifiers = true,
                             coro::cancel_token token = {}) {
    auto raw = co_await service.request_data(description.to_request(), std::move(validators),
                                             apply_modifiers, std::move(token));
    auto text = detail::decode_text_or_throw(raw.data, encoding);
    co_return std::pair<std::string, http::response_metadata>{std::move(text), std::move(raw.metadata)};
}

/// Try each shape in order and return the first that decodes
///
/// Failures of individual shapes are discarded. When every shape fails the
/// result is a decoding error whose message lists the shapes tried.
template<http::request_convertible Description>
coro::task<matched_response> request_with_multiple_response_types(
        network_service& service,
        Description description,
        std::vector<response_shape> shapes,
        std::vector<response_validator> validators = default_validators(),
        bool apply_modifiers = true,
        coro::cancel_token token = {}) {
    auto raw = co_await service.request_data(description.to_request(), std::move(validators),
                                             apply_modifiers, std::move(token));

    std::vector<std::string> tried;
    for (size_t i = 0; i < shapes.size(); ++i) {
        try {
            co_return matched_response{i, shapes[i].name, shapes[i].decode(raw.data)};
        } catch (...) {
            // A shape that fails to decode just moves on to the next one
            tried.push_back(shapes[i].name);
        }
    }

    auto message = shapes.empty()
        ? std::string("no response shapes given")
        : fmt::format("no response shape matched (tried: {})", fmt::join(tried, ", "));
    throw network_error::decoding(std::make_exception_ptr(std::runtime_error(message)), message);
}

/// request_object plus the HTTP response metadata
template<typename T, http::request_convertible Description>
coro::task<std::pair<T, http::http_response>>
request_object_and_response(network_service& service,
                            Description description,
                            std::vector<response_validator> validators = default_validators(),
                            json_decoder decoder = default_json_decoder(),
                            bool apply_modifiers = true,
                            coro::cancel_token token = {}) {
    http::request request = description.to_request();
    const bool logging = service.log_requests();

    auto raw = co_await detail::logged_request_data(service, request, std::move(validators),
                                                    apply_modifiers, std::move(token), logging);

    const auto* response = http::as_http_response(raw.metadata);
    if (!response) {
        if (logging) {
            detail::write_log(std::move(request), std::move(raw.data), false);
        }
        throw network_error::invalid_response_format();
    }

    try {
        T value = detail::decode_or_throw<T>(decoder, raw.data);
        if (logging) {
            detail::write_log(std::move(request), raw.data, true);
        }
        co_return std::pair<T, http::http_response>{std::move(value), *response};
    } catch (const network_error&) {
        if (logging) {
            detail::write_log(std::move(request), std::move(raw.data), false);
        }
        throw;
    }
}

} // namespace courier::pipeline
