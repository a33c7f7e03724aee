#include <catch2/catch.hpp>
#include <woody/api/http_parser.hpp>
#include <woody/api/http_common.hpp>

#include <string>

using namespace woody::api;

TEST_CASE("HTTP request parser - basic GET request", "[http][parser]") {
    request_parser parser;

    std::string raw =
        "GET / HTTP/1.1\r\n"
        "Host: localhost:6669\r\n"
        "Woody-Request-Type: title\r\n"
        "\r\n";

    REQUIRE(parser.feed(raw) == parse_result::complete);

    const auto& req = parser.request();
    REQUIRE(req.kind == method::get);
    REQUIRE(req.method_token == "GET");
    REQUIRE(req.path == "/");
    REQUIRE(req.version == "HTTP/1.1");
    REQUIRE(req.headers.find("host") == "localhost:6669");
    REQUIRE(req.headers.find("WOODY-REQUEST-TYPE") == "title");
    REQUIRE(req.headers.find("woody_request_type") == "title");
    REQUIRE(req.body.empty());
}

TEST_CASE("HTTP request parser - GET with query string", "[http][parser]") {
    request_parser parser;

    REQUIRE(parser.feed("GET /?woodyRequestType=read32&woodyAddress=0x35459C HTTP/1.1\r\n"
                        "Host: localhost\r\n"
                        "\r\n") == parse_result::complete);
    REQUIRE(parser.request().path == "/");
    REQUIRE(parser.request().query == "woodyRequestType=read32&woodyAddress=0x35459C");
}

TEST_CASE("HTTP request parser - POST with form body", "[http][parser]") {
    request_parser parser;

    // Body is one byte short of Content-Length
    REQUIRE(parser.feed("POST / HTTP/1.1\r\n"
                        "Host: localhost\r\n"
                        "Content-Type: application/x-www-form-urlencoded\r\n"
                        "Content-Length: 25\r\n"
                        "\r\n"
                        "woodyRequestType=version") == parse_result::need_more);

    REQUIRE(parser.feed("&") == parse_result::complete);
    REQUIRE(parser.request().kind == method::post);
    REQUIRE(parser.request().body == "woodyRequestType=version&");
    REQUIRE(parser.request().headers.find(field::content_type) == form_content_type);
}

TEST_CASE("HTTP request parser - incremental parsing", "[http][parser]") {
    request_parser parser;

    REQUIRE(parser.feed("GET /?woodyRequestType=status HTTP/1.1\r\n") == parse_result::need_more);
    REQUIRE(parser.feed("Host: local") == parse_result::need_more);
    REQUIRE(parser.feed("host\r\n\r\n") == parse_result::complete);
    REQUIRE(parser.request().headers.find("Host") == "localhost");

    // Completed parsers ignore further input
    REQUIRE(parser.feed("GET /again HTTP/1.1\r\n\r\n") == parse_result::complete);
    REQUIRE(parser.request().query == "woodyRequestType=status");
}

TEST_CASE("HTTP request parser - chunked body", "[http][parser]") {
    SECTION("all at once") {
        request_parser parser;
        REQUIRE(parser.feed("POST / HTTP/1.1\r\n"
                            "Content-Type: application/x-www-form-urlencoded\r\n"
                            "Transfer-Encoding: chunked\r\n"
                            "\r\n"
                            "5\r\n"
                            "woody\r\n"
                            "12\r\n"
                            "RequestType=status\r\n"
                            "0\r\n"
                            "\r\n") == parse_result::complete);
        REQUIRE(parser.request().body == "woodyRequestType=status");
    }

    SECTION("split inside a chunk") {
        request_parser parser;
        REQUIRE(parser.feed("POST / HTTP/1.1\r\n"
                            "Transfer-Encoding: chunked\r\n"
                            "\r\n"
                            "5;ext=1\r\nwo") == parse_result::need_more);
        REQUIRE(parser.feed("ody\r\n0\r\n") == parse_result::need_more);
        REQUIRE(parser.feed("\r\n") == parse_result::complete);
        REQUIRE(parser.request().body == "woody");
    }
}

TEST_CASE("HTTP request parser - malformed input", "[http][parser]") {
    SECTION("bad request line") {
        request_parser parser;
        REQUIRE(parser.feed("NONSENSE\r\n\r\n") == parse_result::error);
        REQUIRE(parser.has_error());
        REQUIRE(parser.error_status() == status::bad_request);
        REQUIRE_FALSE(parser.error_message().empty());
    }

    SECTION("not HTTP") {
        request_parser parser;
        REQUIRE(parser.feed("GET / SPDY/3\r\n\r\n") == parse_result::error);
        REQUIRE(parser.error_status() == status::bad_request);
    }

    SECTION("header without a colon") {
        request_parser parser;
        REQUIRE(parser.feed("GET / HTTP/1.1\r\nWoody\r\n\r\n") == parse_result::error);
        REQUIRE(parser.error_status() == status::bad_request);
    }

    SECTION("invalid Content-Length") {
        request_parser parser;
        REQUIRE(parser.feed("POST / HTTP/1.1\r\n"
                            "Content-Length: 12abc\r\n"
                            "\r\n") == parse_result::error);
        REQUIRE(parser.error_status() == status::bad_request);
    }

    SECTION("invalid chunk size") {
        request_parser parser;
        REQUIRE(parser.feed("POST / HTTP/1.1\r\n"
                            "Transfer-Encoding: chunked\r\n"
                            "\r\n"
                            "zz\r\n") == parse_result::error);
        REQUIRE(parser.error_status() == status::bad_request);
    }
}

TEST_CASE("HTTP request parser - size limits", "[http][parser]") {
    SECTION("oversized head") {
        request_parser parser(parser_limits{64, 1024});
        std::string raw = "GET / HTTP/1.1\r\nX-Padding: " + std::string(100, 'a') + "\r\n\r\n";
        REQUIRE(parser.feed(raw) == parse_result::error);
        REQUIRE(parser.error_status() == status::request_header_fields_too_large);
    }

    SECTION("oversized head without a blank line yet") {
        request_parser parser(parser_limits{64, 1024});
        REQUIRE(parser.feed("GET / HTTP/1.1\r\nX-Padding: " + std::string(100, 'a')) == parse_result::error);
        REQUIRE(parser.error_status() == status::request_header_fields_too_large);
    }

    SECTION("oversized body") {
        request_parser parser(parser_limits{1024, 16});
        REQUIRE(parser.feed("POST / HTTP/1.1\r\n"
                            "Content-Length: 17\r\n"
                            "\r\n") == parse_result::error);
        REQUIRE(parser.error_status() == status::payload_too_large);
    }

    SECTION("oversized chunked body") {
        request_parser parser(parser_limits{1024, 16});
        REQUIRE(parser.feed("POST / HTTP/1.1\r\n"
                            "Transfer-Encoding: chunked\r\n"
                            "\r\n"
                            "11\r\n") == parse_result::error);
        REQUIRE(parser.error_status() == status::payload_too_large);
    }
}

TEST_CASE("HTTP request parser - reset", "[http][parser]") {
    request_parser parser;

    REQUIRE(parser.feed("GET /first HTTP/1.1\r\n\r\n") == parse_result::complete);

    parser.reset();

    REQUIRE(parser.feed("POST /second HTTP/1.1\r\nContent-Length: 0\r\n\r\n") == parse_result::complete);
    REQUIRE(parser.request().kind == method::post);
    REQUIRE(parser.request().path == "/second");
    REQUIRE(parser.request().headers.size() == 1);
}

TEST_CASE("Only GET and POST are served", "[http][method]") {
    REQUIRE(classify_method("GET") == method::get);
    REQUIRE(classify_method("POST") == method::post);
    REQUIRE(classify_method("PUT") == method::other);
    REQUIRE(classify_method("get") == method::other);

    request_parser parser;
    REQUIRE(parser.feed("BREW /pot HTTP/1.1\r\n\r\n") == parse_result::complete);
    REQUIRE(parser.request().kind == method::other);
    REQUIRE(parser.request().method_token == "BREW");
}

TEST_CASE("HTTP status reasons", "[http][status]") {
    REQUIRE(status_reason(status::ok) == "OK");
    REQUIRE(status_reason(status::not_implemented) == "Not Implemented");
    REQUIRE(status_reason(status::bad_gateway) == "Bad Gateway");
    REQUIRE(status_reason(status::service_unavailable) == "Service Unavailable");
    REQUIRE(status_reason(static_cast<status>(418)) == "Unknown");
}

TEST_CASE("Field names are normalized", "[http][fields]") {
    REQUIRE(normalize_key("Woody-Request-Type") == "woodyrequesttype");
    REQUIRE(normalize_key("woody_request_type") == "woodyrequesttype");
    REQUIRE(normalize_key("Content-Length") == field::content_length);

    field_list fields;
    fields.add("Woody-Address", "0x10");
    fields.add("woody_address", "0x20");
    REQUIRE(fields.size() == 2);
    REQUIRE(fields.find("woodyAddress") == "0x10");
    REQUIRE(fields.begin()->first == "woodyaddress");
    REQUIRE_FALSE(fields.contains("woodydata"));
}

TEST_CASE("Form decoding", "[http][form]") {
    REQUIRE(form_decode("woody%20bridge") == "woody bridge");
    REQUIRE(form_decode("a+b") == "a b");
    REQUIRE(form_decode("100%") == "100%");
    REQUIRE(form_decode("%4") == "%4");
    REQUIRE(form_decode("%zz1") == "%zz1");
    REQUIRE(form_decode("%4A%4a") == "JJ");

    auto fields = parse_form("woodyAddress=0x10&woody_data=%32%35&flag&&=orphan&");
    REQUIRE(fields.size() == 3);
    auto it = fields.begin();
    REQUIRE(it->first == "woodyaddress");
    REQUIRE(it->second == "0x10");
    ++it;
    REQUIRE(it->first == "woodydata");
    REQUIRE(it->second == "25");
    ++it;
    REQUIRE(it->first == "flag");
    REQUIRE(it->second.empty());

    REQUIRE(parse_form("").empty());
}
