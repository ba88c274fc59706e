#pragma once

#include <courier/http/http_common.hpp>

#include <chrono>
#include <cstdint>
#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace courier::http {

/// Canonical outgoing request handed to a transport
class request {
public:
    request() = default;

    request(method m, std::string_view target)
        : method_(m), url_(target) {}

    method get_method() const noexcept { return method_; }
    void set_method(method m) noexcept { method_ = m; }

    /// Absolute target URL
    const std::string& target() const noexcept { return url_; }
    void set_target(std::string_view u) { url_ = u; }

    const headers& get_headers() const noexcept { return headers_; }
    headers& get_headers() noexcept { return headers_; }

    void set_header(std::string_view name, std::string_view value) {
        headers_.set(name, value);
    }

    std::string_view header(std::string_view name) const {
        return headers_.get(name);
    }

    std::string_view body() const noexcept { return body_; }
    void set_body(std::string_view b) { body_ = b; }
    void set_body(std::string&& b) { body_ = std::move(b); }

    void set_content_type(std::string_view type) { headers_.set("Content-Type", type); }

    /// Per-request timeout; unset means the transport default applies
    std::optional<std::chrono::milliseconds> timeout() const noexcept { return timeout_; }
    void set_timeout(std::chrono::milliseconds t) noexcept { timeout_ = t; }

    /// A request is its own canonical form
    request to_request() const { return *this; }

    friend bool operator==(const request&, const request&) = default;

private:
    method method_ = method::GET;
    std::string url_;
    headers headers_;
    std::string body_;
    std::optional<std::chrono::milliseconds> timeout_;
};

/// A request description: anything convertible into a canonical request
/// without side effects.
template<typename T>
concept request_convertible = requires(const T& description) {
    { description.to_request() } -> std::convertible_to<request>;
};

/// Metadata of a non-HTTP response (file:, data: or a transport that does
/// not speak HTTP)
struct url_response {
    std::string url;
    std::string mime_type;
    std::optional<size_t> expected_content_length;

    friend bool operator==(const url_response&, const url_response&) = default;
};

/// Metadata of an HTTP response
class http_response {
public:
    http_response() = default;

    http_response(std::string_view url, uint16_t status_code, headers fields = {})
        : url_(url), status_code_(status_code), headers_(std::move(fields)) {}

    const std::string& url() const noexcept { return url_; }
    uint16_t status_code() const noexcept { return status_code_; }

    const headers& get_headers() const noexcept { return headers_; }
    std::string_view header(std::string_view name) const { return headers_.get(name); }

    /// Content-Type without parameters, e.g. "application/json"
    std::string_view mime_type() const {
        auto ct = headers_.content_type();
        auto semi = ct.find(';');
        auto mime = semi == std::string_view::npos ? ct : ct.substr(0, semi);
        while (!mime.empty() && mime.back() == ' ') mime.remove_suffix(1);
        return mime;
    }

    bool is_success() const noexcept { return status_code_ >= 200 && status_code_ < 300; }

    friend bool operator==(const http_response&, const http_response&) = default;

private:
    std::string url_;
    uint16_t status_code_ = 0;
    headers headers_;
};

/// Response metadata as reported by a transport
using response_metadata = std::variant<url_response, http_response>;

/// The HTTP view of the metadata, or nullptr for a non-HTTP response
inline const http_response* as_http_response(const response_metadata& metadata) noexcept {
    return std::get_if<http_response>(&metadata);
}

} // namespace courier::http
