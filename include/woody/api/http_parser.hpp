#pragma once

/// @file http_parser.hpp
/// @brief Reads one HTTP/1.1 request off an API connection
///
/// Bytes are fed as they arrive. The head is parsed once the blank line
/// ending it has been seen; the body is then taken by Content-Length or
/// decoded from chunks. The listener serves one request per connection, so
/// anything after the body is ignored.

#include "http_common.hpp"

#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>

namespace woody::api {

enum class parse_result {
    need_more,
    complete,
    error
};

/// Limits applied while parsing
struct parser_limits {
    size_t max_head_size = 16 * 1024;   ///< request line + headers
    size_t max_body_size = 64 * 1024;
};

/// A fully received request
struct http_request {
    method kind = method::other;
    std::string method_token;
    std::string path;
    std::string query;
    std::string version;
    field_list headers;
    std::string body;
};

class request_parser {
public:
    request_parser() = default;

    explicit request_parser(parser_limits limits) : limits_(limits) {}

    /// Append received bytes and try to complete the request.
    /// Once complete or failed, further input is ignored.
    parse_result feed(std::string_view data) {
        if (state_ != parse_result::need_more) {
            return state_;
        }
        buffer_.append(data);

        if (!head_done_) {
            auto end = buffer_.find("\r\n\r\n");
            size_t head_size = end == std::string::npos ? buffer_.size() : end + 4;
            if (head_size > limits_.max_head_size) {
                return fail("request head too large", status::request_header_fields_too_large);
            }
            if (end == std::string::npos) {
                return state_;
            }
            if (parse_head(std::string_view(buffer_).substr(0, end)) == parse_result::error) {
                return state_;
            }
            buffer_.erase(0, end + 4);
            head_done_ = true;
        }

        return chunked_ ? read_chunks() : read_body();
    }

    const http_request& request() const noexcept { return request_; }

    /// Status to answer a rejected request with
    status error_status() const noexcept { return error_status_; }

    std::string_view error_message() const noexcept { return error_message_; }

    bool is_complete() const noexcept { return state_ == parse_result::complete; }
    bool has_error() const noexcept { return state_ == parse_result::error; }

    void reset() {
        *this = request_parser(limits_);
    }

private:
    static std::string_view trim(std::string_view s) {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
        return s;
    }

    /// Take the next CRLF-terminated line off the head
    static std::string_view next_line(std::string_view& head) {
        auto end = head.find("\r\n");
        auto line = head.substr(0, end);
        head.remove_prefix(end == std::string_view::npos ? head.size() : end + 2);
        return line;
    }

    parse_result parse_head(std::string_view head) {
        // METHOD SP target SP HTTP-version
        auto line = next_line(head);
        auto sp1 = line.find(' ');
        auto sp2 = sp1 == std::string_view::npos ? sp1 : line.find(' ', sp1 + 1);
        if (sp2 == std::string_view::npos || sp1 == 0 || sp2 == sp1 + 1) {
            return fail("malformed request line");
        }

        auto version = line.substr(sp2 + 1);
        if (!version.starts_with("HTTP/")) {
            return fail("unsupported protocol version");
        }
        request_.method_token = line.substr(0, sp1);
        request_.kind = classify_method(request_.method_token);
        request_.version = version;

        auto target = line.substr(sp1 + 1, sp2 - sp1 - 1);
        auto q = target.find('?');
        request_.path = target.substr(0, q);
        if (q != std::string_view::npos) {
            request_.query = target.substr(q + 1);
        }

        while (!head.empty()) {
            auto header = next_line(head);
            auto colon = header.find(':');
            if (colon == std::string_view::npos || colon == 0) {
                return fail("malformed header line");
            }
            request_.headers.add(header.substr(0, colon), std::string(trim(header.substr(colon + 1))));
        }

        if (auto te = request_.headers.find(field::transfer_encoding);
            te && te->find("chunked") != std::string_view::npos) {
            chunked_ = true;
        } else if (auto len = request_.headers.find(field::content_length)) {
            auto [ptr, ec] = std::from_chars(len->data(), len->data() + len->size(), content_length_);
            if (len->empty() || ec != std::errc{} || ptr != len->data() + len->size()) {
                return fail("invalid Content-Length");
            }
            if (content_length_ > limits_.max_body_size) {
                return fail("request body too large", status::payload_too_large);
            }
        }
        return parse_result::need_more;
    }

    parse_result read_body() {
        if (buffer_.size() < content_length_) {
            return state_;
        }
        request_.body.assign(buffer_, 0, content_length_);
        buffer_.clear();
        return state_ = parse_result::complete;
    }

    /// Decode every complete chunk in the buffer
    parse_result read_chunks() {
        for (;;) {
            auto line_end = buffer_.find("\r\n");
            if (line_end == std::string::npos) {
                return state_;
            }

            // Hex size, optionally followed by ";extension"
            size_t size = 0;
            auto [ptr, ec] = std::from_chars(buffer_.data(), buffer_.data() + line_end, size, 16);
            if (ec != std::errc{} || ptr == buffer_.data()) {
                return fail("invalid chunk size");
            }
            if (request_.body.size() + size > limits_.max_body_size) {
                return fail("request body too large", status::payload_too_large);
            }

            if (size == 0) {
                // Trailer fields end at a blank line
                if (buffer_.find("\r\n\r\n", line_end) == std::string::npos) {
                    return state_;
                }
                buffer_.clear();
                return state_ = parse_result::complete;
            }

            size_t data_end = line_end + 2 + size;
            if (buffer_.size() < data_end + 2) {
                return state_;
            }
            request_.body.append(buffer_, line_end + 2, size);
            buffer_.erase(0, data_end + 2);
        }
    }

    parse_result fail(std::string_view message, status code = status::bad_request) {
        error_status_ = code;
        error_message_ = message;
        return state_ = parse_result::error;
    }

    parser_limits limits_;
    parse_result state_ = parse_result::need_more;
    http_request request_;
    std::string buffer_;
    bool head_done_ = false;
    bool chunked_ = false;
    size_t content_length_ = 0;
    status error_status_ = status::bad_request;
    std::string error_message_;
};

} // namespace woody::api
