#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace courier::pipeline {

/// JSON decoding options
struct json_decoder_options {
    bool ignore_comments = false;   ///< Accept // and /* */ comments
};

/// Decodes response bytes into values through nlohmann::json
///
/// Any type with a from_json overload (or NLOHMANN_DEFINE_TYPE_* macro)
/// decodes. Failures surface as nlohmann::json::exception or whatever the
/// type's from_json throws.
class json_decoder {
public:
    json_decoder() = default;
    explicit json_decoder(json_decoder_options options) : options_(options) {}

    [[nodiscard]] nlohmann::json parse(std::string_view data) const {
        return nlohmann::json::parse(data, nullptr, true, options_.ignore_comments);
    }

    template<typename T>
    [[nodiscard]] T decode(std::string_view data) const {
        return parse(data).template get<T>();
    }

    [[nodiscard]] const json_decoder_options& options() const noexcept { return options_; }

private:
    json_decoder_options options_;
};

/// Decoder used when a call does not supply one
inline const json_decoder& default_json_decoder() {
    static const json_decoder decoder;
    return decoder;
}

/// Text encodings accepted by request_string
enum class string_encoding {
    utf8,
    ascii,
    iso_latin1
};

namespace detail {

/// Length of the UTF-8 sequence starting at data[i], 0 if malformed
inline size_t utf8_sequence_length(std::string_view data, size_t i) noexcept {
    auto byte = [&](size_t k) { return static_cast<uint8_t>(data[k]); };
    const uint8_t lead = byte(i);
    size_t len = 0;
    uint32_t cp = 0;
    if (lead < 0x80) {
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2; cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3; cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4; cp = lead & 0x07;
    } else {
        return 0;
    }
    if (i + len > data.size()) {
        return 0;
    }
    for (size_t k = 1; k < len; ++k) {
        if ((byte(i + k) & 0xC0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (byte(i + k) & 0x3F);
    }
    // Overlong forms, surrogates and out-of-range code points
    static constexpr uint32_t min_for_len[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < min_for_len[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;
    }
    return len;
}

} // namespace detail

/// Interpret bytes in the given encoding and return them as UTF-8
/// nullopt when the bytes are not valid in that encoding.
inline std::optional<std::string> decode_string(std::string_view data, string_encoding encoding) {
    switch (encoding) {
        case string_encoding::utf8:
            for (size_t i = 0; i < data.size();) {
                auto len = detail::utf8_sequence_length(data, i);
                if (len == 0) {
                    return std::nullopt;
                }
                i += len;
            }
            return std::string(data);

        case string_encoding::ascii:
            for (char c : data) {
                if (static_cast<uint8_t>(c) >= 0x80) {
                    return std::nullopt;
                }
            }
            return std::string(data);

        case string_encoding::iso_latin1: {
            std::string out;
            out.reserve(data.size());
            for (char c : data) {
                auto b = static_cast<uint8_t>(c);
                if (b < 0x80) {
                    out += c;
                } else {
                    out += static_cast<char>(0xC0 | (b >> 6));
                    out += static_cast<char>(0x80 | (b & 0x3F));
                }
            }
            return out;
        }
    }
    return std::nullopt;
}

} // namespace courier::pipeline
