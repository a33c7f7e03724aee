#include <catch2/catch.hpp>
#include <woody/config.hpp>

#include <map>
#include <string>
#include <vector>

using namespace woody;
using woody::pine::pine_errc;

namespace {

bridge_config::getenv_fn env_of(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](std::string_view name) -> std::optional<std::string> {
        auto it = vars.find(std::string(name));
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

pine::pine_result<bridge_config> load(std::vector<const char*> args,
                                      std::map<std::string, std::string> vars = {}) {
    args.insert(args.begin(), "woody_bridge");
    return bridge_config::load(static_cast<int>(args.size()), args.data(), env_of(std::move(vars)));
}

} // namespace

TEST_CASE("Defaults", "[config]") {
    auto cfg = load({});
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->port == 6669);
    REQUIRE(cfg->log_level == log::level::info);
    REQUIRE(cfg->target.empty());
    REQUIRE(cfg->slot == 0);
    REQUIRE_FALSE(cfg->show_help);
}

TEST_CASE("Environment variables", "[config]") {
    auto cfg = load({}, {{"WOODY_PORT", "7000"},
                         {"WOODY_LOG_LEVEL", "debug"},
                         {"WOODY_TARGET", "rpcs3"},
                         {"WOODY_SLOT", "28100"}});
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->port == 7000);
    REQUIRE(cfg->log_level == log::level::debug);
    REQUIRE(cfg->target == "rpcs3");
    REQUIRE(cfg->slot == 28100);
}

TEST_CASE("Unknown log level falls back to info", "[config]") {
    auto cfg = load({}, {{"WOODY_LOG_LEVEL", "chatty"}});
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->log_level == log::level::info);
}

TEST_CASE("Command line overrides the environment", "[config]") {
    auto cfg = load({"--port", "7001", "--log-level=error", "--target", "pcsx2"},
                    {{"WOODY_PORT", "7000"}, {"WOODY_TARGET", "rpcs3"}});
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->port == 7001);
    REQUIRE(cfg->log_level == log::level::error);
    REQUIRE(cfg->target == "pcsx2");

    auto short_port = load({"-p", "8080"});
    REQUIRE(short_port.has_value());
    REQUIRE(short_port->port == 8080);
}

TEST_CASE("Help flag", "[config]") {
    auto cfg = load({"--help"});
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->show_help);

    auto text = bridge_config::usage("woody_bridge");
    REQUIRE(text.find("Usage: woody_bridge") != std::string::npos);
    REQUIRE(text.find("pcsx2, rpcs3") != std::string::npos);
    REQUIRE(text.find("6669") != std::string::npos);
}

TEST_CASE("Invalid settings are rejected", "[config]") {
    SECTION("port zero") {
        auto cfg = load({"--port", "0"});
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().code == pine_errc::invalid_parameter);
    }

    SECTION("port out of range") {
        auto cfg = load({}, {{"WOODY_PORT", "70000"}});
        REQUIRE_FALSE(cfg.has_value());
    }

    SECTION("missing value") {
        auto cfg = load({"--slot"});
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().message == "option --slot requires a value");
    }

    SECTION("unknown option") {
        auto cfg = load({"--verbose"});
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().message == "unknown option --verbose");
    }

    SECTION("unknown log level on the command line") {
        auto cfg = load({"--log-level", "chatty"});
        REQUIRE_FALSE(cfg.has_value());
    }

    SECTION("unknown target without a slot") {
        auto cfg = load({"--target", "dolphin"});
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().code == pine_errc::unknown_target);
    }

    SECTION("unknown target with a slot is allowed") {
        auto cfg = load({"--target", "dolphin", "--slot", "40000"});
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->slot == 40000);
    }
}
