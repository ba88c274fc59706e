#pragma once

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace courier::http {

/// HTTP methods
enum class method {
    GET,
    HEAD,
    POST,
    PUT,
    DELETE_,  // DELETE is a C++ keyword
    OPTIONS,
    PATCH
};

inline constexpr std::string_view method_to_string(method m) noexcept {
    switch (m) {
        case method::GET:      return "GET";
        case method::HEAD:     return "HEAD";
        case method::POST:     return "POST";
        case method::PUT:      return "PUT";
        case method::DELETE_:  return "DELETE";
        case method::OPTIONS:  return "OPTIONS";
        case method::PATCH:    return "PATCH";
    }
    return "UNKNOWN";
}

struct case_insensitive_hash {
    size_t operator()(std::string_view s) const noexcept {
        size_t hash = 0;
        for (char c : s) {
            hash = hash * 31 + static_cast<size_t>(std::tolower(static_cast<unsigned char>(c)));
        }
        return hash;
    }
};

struct case_insensitive_equal {
    bool operator()(std::string_view a, std::string_view b) const noexcept {
        return a.size() == b.size() &&
            std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                return std::tolower(static_cast<unsigned char>(x)) ==
                       std::tolower(static_cast<unsigned char>(y));
            });
    }
};

/// HTTP header fields with case-insensitive names
class headers {
public:
    using map_type = std::unordered_map<std::string, std::string, case_insensitive_hash, case_insensitive_equal>;
    using const_iterator = map_type::const_iterator;

    headers() = default;

    headers(std::initializer_list<std::pair<const std::string, std::string>> fields)
        : headers_(fields) {}

    /// Set a header, replacing any previous value
    void set(std::string_view name, std::string_view value) {
        headers_[std::string(name)] = std::string(value);
    }

    /// Set a header only when it is not present yet
    bool set_if_absent(std::string_view name, std::string_view value) {
        return headers_.try_emplace(std::string(name), value).second;
    }

    /// Get a header value (empty if not found)
    std::string_view get(std::string_view name) const {
        auto it = headers_.find(std::string(name));
        if (it != headers_.end()) {
            return it->second;
        }
        return {};
    }

    bool contains(std::string_view name) const {
        return headers_.find(std::string(name)) != headers_.end();
    }

    void remove(std::string_view name) {
        headers_.erase(std::string(name));
    }

    std::string_view content_type() const {
        return get("Content-Type");
    }

    size_t size() const noexcept { return headers_.size(); }
    bool empty() const noexcept { return headers_.empty(); }

    const_iterator begin() const { return headers_.begin(); }
    const_iterator end() const { return headers_.end(); }

    friend bool operator==(const headers& a, const headers& b) {
        return a.headers_ == b.headers_;
    }

private:
    map_type headers_;
};

/// MIME types the pipeline inspects
namespace mime {

inline constexpr std::string_view application_json = "application/json";

/// True for application/json and any structured "+json" subtype
/// (application/problem+json), compared case-insensitively
inline bool is_json(std::string_view type) noexcept {
    constexpr std::string_view suffix = "+json";
    if (case_insensitive_equal{}(type, application_json)) {
        return true;
    }
    auto slash = type.find('/');
    return slash != std::string_view::npos && type.size() > slash + 1 + suffix.size() &&
        case_insensitive_equal{}(type.substr(type.size() - suffix.size()), suffix);
}

} // namespace mime

} // namespace courier::http
