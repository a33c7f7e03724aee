#pragma once

/// @file dispatcher.hpp
/// @brief Translate API requests into PINE exchanges and back
///
/// Parameters come from a form-urlencoded body, the query string and the
/// headers, in that order of precedence. Keys are normalized by lowercasing
/// and dropping '-' and '_', so "Woody-Request-Type", "woody_request_type"
/// and "woodyRequestType" all name the same parameter.
///
/// Status mapping:
///   missing/invalid parameter, unknown operation   400
///   emulator result code 0 / 255 / other           200 / 500 / 501
///   answer frame could not be decoded              502
///   no emulator connection, transport failure      503

#include "http_common.hpp"
#include "http_parser.hpp"

#include <woody/client/session.hpp>
#include <woody/log/macros.hpp>
#include <woody/pine/pine.hpp>

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>

namespace woody::api {

using pine::make_error;
using pine::pine_errc;
using pine::pine_result;

/// Parameter names after normalization
namespace param {
    inline constexpr std::string_view request_type = "woodyrequesttype";
    inline constexpr std::string_view address = "woodyaddress";
    inline constexpr std::string_view data = "woodydata";
    inline constexpr std::string_view slot = "woodyslot";
}

/// An API call: operation name plus normalized parameters
struct api_request {
    std::string operation;
    std::unordered_map<std::string, std::string> params;
};

/// Status and JSON body to send back
struct api_response {
    status code = status::ok;
    std::string body;
};

inline std::string to_lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

/// Collect the API call carried by a received HTTP request
inline api_request collect_parameters(const http_request& req) {
    std::unordered_map<std::string, std::string> merged;
    auto merge = [&merged](const field_list& fields) {
        for (const auto& [key, value] : fields) {
            merged.try_emplace(key, value);
        }
    };

    if (auto type = req.headers.find(field::content_type); type && type->starts_with(form_content_type)) {
        merge(parse_form(req.body));
    }
    merge(parse_form(req.query));
    merge(req.headers);

    api_request out;
    if (auto it = merged.find(std::string(param::request_type)); it != merged.end()) {
        out.operation = to_lower(it->second);
        merged.erase(it);
    }
    out.params = std::move(merged);
    return out;
}

/// Parse "0x"-prefixed hex or decimal, rejecting values wider than bits
inline std::optional<uint64_t> parse_number(std::string_view text, unsigned bits) {
    int base = 10;
    if (text.starts_with("0x") || text.starts_with("0X")) {
        base = 16;
        text.remove_prefix(2);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    if (bits < 64 && value > ((uint64_t{1} << bits) - 1)) {
        return std::nullopt;
    }
    return value;
}

/// Escape a string for inclusion in a JSON string literal
inline std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(c)));
                } else {
                    out += c;
                }
        }
    }
    return out;
}

/// {"errMessage":"..."}
inline api_response error_response(status code, std::string_view message) {
    return {code, fmt::format(R"({{"errMessage":"{}"}})", json_escape(message))};
}

/// HTTP status for an emulator result code
constexpr status status_for_result(uint8_t result_code) noexcept {
    if (result_code == pine::result_ok) {
        return status::ok;
    }
    if (result_code == pine::result_fail) {
        return status::internal_server_error;
    }
    return status::not_implemented;
}

/// HTTP status for a failed exchange
constexpr status status_for_error(pine_errc code) noexcept {
    switch (code) {
        case pine_errc::unknown_operation:
        case pine_errc::invalid_parameter:
            return status::bad_request;
        case pine_errc::malformed_frame:
            return status::bad_gateway;
        case pine_errc::not_connected:
        case pine_errc::connection_failed:
        case pine_errc::timeout:
        case pine_errc::io_error:
            return status::service_unavailable;
        default:
            return status::internal_server_error;
    }
}

/// JSON member name of the text carried by a string answer
constexpr std::string_view text_field_name(pine::opcode op) noexcept {
    switch (op) {
        case pine::opcode::version: return "version";
        case pine::opcode::title: return "title";
        case pine::opcode::id: return "id";
        case pine::opcode::uuid: return "uuid";
        case pine::opcode::game_version: return "gameVersion";
        default: return "text";
    }
}

/// Render an answer as the JSON response body
inline std::string answer_to_json(const pine::pine_answer& answer) {
    return std::visit([](const auto& a) -> std::string {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, pine::status_answer>) {
            if (a.status) {
                return fmt::format(R"({{"resultCode":{},"status":{}}})", a.result_code, *a.status);
            }
            return fmt::format(R"({{"resultCode":{},"status":null}})", a.result_code);
        } else if constexpr (requires { a.memory_value; }) {
            return fmt::format(R"({{"resultCode":{},"memoryValue":{}}})",
                               a.result_code, static_cast<uint64_t>(a.memory_value));
        } else if constexpr (requires { a.text; }) {
            return fmt::format(R"({{"resultCode":{},"{}":"{}"}})",
                               a.result_code, text_field_name(T::code), json_escape(a.text));
        } else {
            return fmt::format(R"({{"resultCode":{}}})", a.result_code);
        }
    }, answer);
}

namespace detail {

inline pine_result<uint64_t> required_number(const api_request& req, std::string_view key,
                                             std::string_view what, unsigned bits) {
    auto it = req.params.find(std::string(key));
    if (it == req.params.end()) {
        return make_error(pine_errc::invalid_parameter,
                          fmt::format("no {} provided for {} PINE request", what, req.operation));
    }
    auto value = parse_number(it->second, bits);
    if (!value) {
        return make_error(pine_errc::invalid_parameter,
                          fmt::format("unable to parse {} {} for {} PINE request",
                                      what, it->second, req.operation));
    }
    return *value;
}

template<size_t I = 0>
pine::pine_request default_request(pine::opcode op) {
    if constexpr (I + 1 < std::variant_size_v<pine::pine_request>) {
        if (static_cast<size_t>(op) != I) {
            return default_request<I + 1>(op);
        }
    }
    return pine::pine_request(std::in_place_index<I>);
}

} // namespace detail

/// Build a typed request from an API call
inline pine_result<pine::pine_request> build_request(const api_request& req) {
    auto layout = pine::find_operation(req.operation);
    if (!layout) {
        return make_error(pine_errc::unknown_operation,
                          fmt::format("unknown PINE request type \"{}\"", req.operation));
    }

    uint32_t address = 0;
    uint64_t data = 0;
    uint8_t slot = 0;

    if ((*layout)->address_bytes > 0) {
        auto v = detail::required_number(req, param::address, "address", 32);
        if (!v) return std::unexpected(std::move(v.error()));
        address = static_cast<uint32_t>(*v);
    }
    if ((*layout)->data_bytes > 0) {
        auto v = detail::required_number(req, param::data, "data", (*layout)->data_bytes * 8u);
        if (!v) return std::unexpected(std::move(v.error()));
        data = *v;
    }
    if ((*layout)->slot_bytes > 0) {
        auto v = detail::required_number(req, param::slot, "slot", 8);
        if (!v) return std::unexpected(std::move(v.error()));
        slot = static_cast<uint8_t>(*v);
    }

    auto request = detail::default_request((*layout)->code);
    std::visit([&](auto& r) {
        using R = std::decay_t<decltype(r)>;
        if constexpr (requires { r.address; }) {
            r.address = address;
        }
        if constexpr (requires { r.data; }) {
            r.data = static_cast<typename R::value_type>(data);
        }
        if constexpr (requires { r.slot; }) {
            r.slot = slot;
        }
    }, request);
    return request;
}

/// Routes API calls to the emulator
class dispatcher {
public:
    /// Performs one PINE exchange
    using exchange_fn = std::function<pine_result<pine::pine_answer>(const pine::pine_request&)>;

    /// Dispatch to the session's active connection
    explicit dispatcher(client::session_manager& session)
        : exchange_([&session](const pine::pine_request& r) { return session.exchange(r); }) {}

    /// Dispatch to an arbitrary exchange function
    explicit dispatcher(exchange_fn fn)
        : exchange_(std::move(fn)) {}

    /// Handle one API call
    api_response handle(const api_request& req) const {
        WOODY_LOG_INFO("processing {} PINE request", req.operation.empty() ? "(none)" : req.operation);

        if (req.operation.empty()) {
            WOODY_LOG_ERROR("no PINE request type found in HTTP request");
            return error_response(status::bad_request, "no PINE request type found in HTTP request");
        }

        auto request = build_request(req);
        if (!request) {
            WOODY_LOG_ERROR("{}", request.error().message);
            return error_response(status::bad_request, request.error().message);
        }

        auto answer = exchange_(*request);
        if (!answer) {
            const auto& err = answer.error();
            WOODY_LOG_ERROR("{} PINE request failed: {}", req.operation, err.to_string());
            return error_response(status_for_error(err.code),
                                  fmt::format("error while exchanging {} PINE request: {}",
                                              req.operation, err.to_string()));
        }

        api_response resp{status_for_result(pine::result_code_of(*answer)), answer_to_json(*answer)};
        WOODY_LOG_DEBUG("response body: {}", resp.body);
        return resp;
    }

    /// Handle a received HTTP request
    api_response handle(const http_request& http) const {
        return handle(collect_parameters(http));
    }

private:
    exchange_fn exchange_;
};

} // namespace woody::api
