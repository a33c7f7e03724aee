#pragma once

/// @file http_common.hpp
/// @brief Field names, form decoding and statuses of the bridge API
///
/// Every name the API looks at (header names, query keys, form keys) is
/// compared in normalized form: lowercase with '-' and '_' removed. A
/// `field_list` stores names already normalized, so "Content-Length",
/// "content_length" and "contentLength" are the same field.

#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace woody::api {

/// Lowercase a key and drop '-' and '_'
inline std::string normalize_key(std::string_view key) {
    std::string out;
    out.reserve(key.size());
    for (char c : key) {
        if (c != '-' && c != '_') {
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return out;
}

/// Normalized names of the header fields the listener reads
namespace field {
    inline constexpr std::string_view content_length = "contentlength";
    inline constexpr std::string_view content_type = "contenttype";
    inline constexpr std::string_view transfer_encoding = "transferencoding";
}

inline constexpr std::string_view json_content_type = "application/json";
inline constexpr std::string_view form_content_type = "application/x-www-form-urlencoded";

/// Name/value pairs keyed by normalized name, kept in arrival order.
/// Repeated names are all kept; find() returns the first.
class field_list {
public:
    using value_type = std::pair<std::string, std::string>;
    using const_iterator = std::vector<value_type>::const_iterator;

    void add(std::string_view name, std::string value) {
        fields_.emplace_back(normalize_key(name), std::move(value));
    }

    std::optional<std::string_view> find(std::string_view name) const {
        auto key = normalize_key(name);
        for (const auto& [k, v] : fields_) {
            if (k == key) {
                return std::string_view(v);
            }
        }
        return std::nullopt;
    }

    bool contains(std::string_view name) const { return find(name).has_value(); }

    size_t size() const noexcept { return fields_.size(); }
    bool empty() const noexcept { return fields_.empty(); }
    void clear() noexcept { fields_.clear(); }

    const_iterator begin() const noexcept { return fields_.begin(); }
    const_iterator end() const noexcept { return fields_.end(); }

private:
    std::vector<value_type> fields_;
};

namespace detail {

constexpr int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace detail

/// Decode one form-urlencoded component. "+" is a space; a '%' not
/// followed by two hex digits is kept as is.
inline std::string form_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out += ' ';
            continue;
        }
        if (c == '%' && text.size() - i > 2) {
            int hi = detail::hex_value(text[i + 1]);
            int lo = detail::hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += c;
    }
    return out;
}

/// Split a query string or form body on '&' into normalized fields.
/// "flag" without '=' has an empty value; pieces with no name are dropped.
inline field_list parse_form(std::string_view text) {
    field_list fields;
    for (size_t pos = 0; pos < text.size();) {
        auto amp = text.find('&', pos);
        auto piece = text.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
        pos = amp == std::string_view::npos ? text.size() : amp + 1;

        auto eq = piece.find('=');
        auto name = form_decode(piece.substr(0, eq));
        if (name.empty()) {
            continue;
        }
        fields.add(name, eq == std::string_view::npos ? std::string() : form_decode(piece.substr(eq + 1)));
    }
    return fields;
}

/// Methods the bridge serves; anything else gets 405
enum class method : uint8_t {
    get,
    post,
    other
};

constexpr method classify_method(std::string_view token) noexcept {
    if (token == "GET") return method::get;
    if (token == "POST") return method::post;
    return method::other;
}

/// Statuses the bridge answers with
enum class status : uint16_t {
    ok = 200,
    bad_request = 400,
    method_not_allowed = 405,
    request_timeout = 408,
    payload_too_large = 413,
    request_header_fields_too_large = 431,
    internal_server_error = 500,
    not_implemented = 501,
    bad_gateway = 502,
    service_unavailable = 503,
};

inline constexpr std::pair<status, std::string_view> status_reasons[] = {
    {status::ok, "OK"},
    {status::bad_request, "Bad Request"},
    {status::method_not_allowed, "Method Not Allowed"},
    {status::request_timeout, "Request Timeout"},
    {status::payload_too_large, "Payload Too Large"},
    {status::request_header_fields_too_large, "Request Header Fields Too Large"},
    {status::internal_server_error, "Internal Server Error"},
    {status::not_implemented, "Not Implemented"},
    {status::bad_gateway, "Bad Gateway"},
    {status::service_unavailable, "Service Unavailable"},
};

constexpr std::string_view status_reason(status s) noexcept {
    for (const auto& [code, reason] : status_reasons) {
        if (code == s) {
            return reason;
        }
    }
    return "Unknown";
}

} // namespace woody::api
