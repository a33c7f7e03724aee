#include <catch2/catch.hpp>
#include <woody/api/dispatcher.hpp>
#include <woody/api/http_parser.hpp>

#include <string>
#include <variant>

using namespace woody::api;
using namespace woody::pine;

namespace {

api_request call(std::string operation,
                 std::unordered_map<std::string, std::string> params = {}) {
    return {std::move(operation), std::move(params)};
}

http_request parsed(std::string_view raw) {
    request_parser parser;
    REQUIRE(parser.feed(raw) == parse_result::complete);
    return parser.request();
}

} // namespace

TEST_CASE("Parameter keys are normalized", "[api][params]") {
    REQUIRE(normalize_key("Woody-Request-Type") == "woodyrequesttype");
    REQUIRE(normalize_key("woody_request_type") == "woodyrequesttype");
    REQUIRE(normalize_key("woodyRequestType") == "woodyrequesttype");
    REQUIRE(normalize_key("WOODYADDRESS") == "woodyaddress");
}

TEST_CASE("Numbers parse as hex or decimal within range", "[api][params]") {
    REQUIRE(parse_number("0x35459C", 32) == 0x35459Cu);
    REQUIRE(parse_number("0X35459c", 32) == 0x35459Cu);
    REQUIRE(parse_number("3491228", 32) == 3491228u);
    REQUIRE(parse_number("255", 8) == 255u);
    REQUIRE(parse_number("0xFFFFFFFFFFFFFFFF", 64) == 0xFFFFFFFFFFFFFFFFull);

    REQUIRE_FALSE(parse_number("256", 8).has_value());
    REQUIRE_FALSE(parse_number("0x100000000", 32).has_value());
    REQUIRE_FALSE(parse_number("", 32).has_value());
    REQUIRE_FALSE(parse_number("0x", 32).has_value());
    REQUIRE_FALSE(parse_number("12ab", 32).has_value());
    REQUIRE_FALSE(parse_number("-1", 32).has_value());
}

TEST_CASE("Parameters come from body, query and headers", "[api][params]") {
    SECTION("headers only") {
        auto req = collect_parameters(parsed(
            "GET / HTTP/1.1\r\n"
            "Woody-Request-Type: Read32\r\n"
            "Woody-Address: 0x10\r\n"
            "\r\n"));
        REQUIRE(req.operation == "read32");
        REQUIRE(req.params.at("woodyaddress") == "0x10");
        REQUIRE_FALSE(req.params.contains("woodyrequesttype"));
    }

    SECTION("query wins over headers") {
        auto req = collect_parameters(parsed(
            "GET /?woodyRequestType=read8&woodyAddress=0x20 HTTP/1.1\r\n"
            "Woody-Address: 0x10\r\n"
            "\r\n"));
        REQUIRE(req.operation == "read8");
        REQUIRE(req.params.at("woodyaddress") == "0x20");
    }

    SECTION("form body wins over query") {
        auto req = collect_parameters(parsed(
            "POST /?woodyAddress=0x20 HTTP/1.1\r\n"
            "Content-Type: application/x-www-form-urlencoded\r\n"
            "Content-Length: 41\r\n"
            "\r\n"
            "woody_request_type=write8&woody_data=0x45"));
        REQUIRE(req.operation == "write8");
        REQUIRE(req.params.at("woodyaddress") == "0x20");
        REQUIRE(req.params.at("woodydata") == "0x45");
    }

    SECTION("first occurrence wins within one source") {
        auto req = collect_parameters(parsed(
            "GET /?woodyRequestType=read8&woody-address=0x30&WOODY_ADDRESS=0x40 HTTP/1.1\r\n"
            "\r\n"));
        REQUIRE(req.params.at("woodyaddress") == "0x30");
    }

    SECTION("non-form bodies are not parameters") {
        auto req = collect_parameters(parsed(
            "POST / HTTP/1.1\r\n"
            "Content-Type: application/json\r\n"
            "Content-Length: 21\r\n"
            "\r\n"
            "woodyRequestType=read"));
        REQUIRE(req.operation.empty());
    }
}

TEST_CASE("Status mapping", "[api][status]") {
    REQUIRE(status_for_result(0) == status::ok);
    REQUIRE(status_for_result(255) == status::internal_server_error);
    REQUIRE(status_for_result(1) == status::not_implemented);

    REQUIRE(status_for_error(pine_errc::invalid_parameter) == status::bad_request);
    REQUIRE(status_for_error(pine_errc::unknown_operation) == status::bad_request);
    REQUIRE(status_for_error(pine_errc::malformed_frame) == status::bad_gateway);
    REQUIRE(status_for_error(pine_errc::not_connected) == status::service_unavailable);
    REQUIRE(status_for_error(pine_errc::timeout) == status::service_unavailable);
    REQUIRE(status_for_error(pine_errc::connection_failed) == status::service_unavailable);
    REQUIRE(status_for_error(pine_errc::internal) == status::internal_server_error);
}

TEST_CASE("Answers render as JSON", "[api][json]") {
    REQUIRE(answer_to_json(read32_answer{0, 0x35459C}) == R"({"resultCode":0,"memoryValue":3491228})");
    REQUIRE(answer_to_json(write8_answer{255}) == R"({"resultCode":255})");
    REQUIRE(answer_to_json(status_answer{0, 2u}) == R"({"resultCode":0,"status":2})");
    REQUIRE(answer_to_json(status_answer{255, std::nullopt}) == R"({"resultCode":255,"status":null})");
    REQUIRE(answer_to_json(game_version_answer{0, "1.01"}) == R"({"resultCode":0,"gameVersion":"1.01"})");
    REQUIRE(answer_to_json(title_answer{0, "Say \"hi\"\n"}) ==
            R"({"resultCode":0,"title":"Say \"hi\"\n"})");
}

TEST_CASE("Error bodies", "[api][json]") {
    auto resp = error_response(status::bad_request, "no \"address\"");
    REQUIRE(resp.code == status::bad_request);
    REQUIRE(resp.body == R"({"errMessage":"no \"address\""})");

    REQUIRE(json_escape(std::string_view("\x01", 1)) == "\\u0001");
}

TEST_CASE("Requests are built from parameters", "[api][build]") {
    SECTION("read with address") {
        auto req = build_request(call("read32", {{"woodyaddress", "0x35459C"}}));
        REQUIRE(req.has_value());
        REQUIRE(std::get<read32_request>(*req).address == 0x35459C);
    }

    SECTION("write with data of the opcode width") {
        auto req = build_request(call("write16", {{"woodyaddress", "16"}, {"woodydata", "0xBEEF"}}));
        REQUIRE(req.has_value());
        auto& w = std::get<write16_request>(*req);
        REQUIRE(w.address == 16);
        REQUIRE(w.data == 0xBEEF);

        auto too_wide = build_request(call("write8", {{"woodyaddress", "16"}, {"woodydata", "0x100"}}));
        REQUIRE_FALSE(too_wide.has_value());
        REQUIRE(too_wide.error().code == pine_errc::invalid_parameter);
    }

    SECTION("save state with slot") {
        auto req = build_request(call("savestate", {{"woodyslot", "2"}}));
        REQUIRE(req.has_value());
        REQUIRE(std::get<save_state_request>(*req).slot == 2);
    }

    SECTION("queries need no parameters") {
        auto req = build_request(call("gameversion"));
        REQUIRE(req.has_value());
        REQUIRE(opcode_of(*req) == opcode::game_version);
    }

    SECTION("missing address") {
        auto req = build_request(call("read8"));
        REQUIRE_FALSE(req.has_value());
        REQUIRE(req.error().message == "no address provided for read8 PINE request");
    }

    SECTION("unparsable address") {
        auto req = build_request(call("read8", {{"woodyaddress", "zz"}}));
        REQUIRE_FALSE(req.has_value());
        REQUIRE(req.error().message == "unable to parse address zz for read8 PINE request");
    }

    SECTION("unknown operation") {
        auto req = build_request(call("read128"));
        REQUIRE_FALSE(req.has_value());
        REQUIRE(req.error().code == pine_errc::unknown_operation);
        REQUIRE(req.error().message == "unknown PINE request type \"read128\"");
    }
}

TEST_CASE("Dispatcher maps exchanges to responses", "[api][dispatcher]") {
    pine_request seen;
    int calls = 0;
    pine_result<pine_answer> next = pine_answer(read8_answer{0, 0x45});

    dispatcher d([&](const pine_request& r) -> pine_result<pine_answer> {
        seen = r;
        ++calls;
        return next;
    });

    SECTION("success") {
        auto resp = d.handle(call("read8", {{"woodyaddress", "0x35459C"}}));
        REQUIRE(resp.code == status::ok);
        REQUIRE(resp.body == R"({"resultCode":0,"memoryValue":69})");
        REQUIRE(std::get<read8_request>(seen).address == 0x35459C);
    }

    SECTION("emulator failure") {
        next = pine_answer(title_answer{255, ""});
        auto resp = d.handle(call("title"));
        REQUIRE(resp.code == status::internal_server_error);
    }

    SECTION("unexpected result code") {
        next = pine_answer(write8_answer{3});
        auto resp = d.handle(call("write8", {{"woodyaddress", "1"}, {"woodydata", "2"}}));
        REQUIRE(resp.code == status::not_implemented);
    }

    SECTION("bad parameters never reach the emulator") {
        auto resp = d.handle(call("read8"));
        REQUIRE(resp.code == status::bad_request);
        REQUIRE(resp.body == R"({"errMessage":"no address provided for read8 PINE request"})");
        REQUIRE(calls == 0);
    }

    SECTION("missing request type") {
        auto resp = d.handle(call(""));
        REQUIRE(resp.code == status::bad_request);
        REQUIRE(resp.body.find("no PINE request type found") != std::string::npos);
        REQUIRE(calls == 0);
    }

    SECTION("not connected") {
        next = make_error(pine_errc::not_connected, "no emulator connection");
        auto resp = d.handle(call("status"));
        REQUIRE(resp.code == status::service_unavailable);
        REQUIRE(resp.body.starts_with(R"({"errMessage":")"));
    }

    SECTION("malformed answer") {
        next = make_error(pine_errc::malformed_frame, "read8 answer: declared length 7 not accepted");
        auto resp = d.handle(call("read8", {{"woodyaddress", "0"}}));
        REQUIRE(resp.code == status::bad_gateway);
    }

    SECTION("parsed HTTP request") {
        auto resp = d.handle(parsed("GET /?woodyRequestType=read8&woodyAddress=0x10 HTTP/1.1\r\n\r\n"));
        REQUIRE(resp.code == status::ok);
        REQUIRE(std::get<read8_request>(seen).address == 0x10);
    }
}
