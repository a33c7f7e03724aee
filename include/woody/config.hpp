#pragma once

/// @file config.hpp
/// @brief Bridge configuration from environment and command line
///
/// Environment:
///   WOODY_LOG_LEVEL   debug | info | warn | error (default info)
///   WOODY_PORT        API port (default 6669)
///   WOODY_TARGET      connect only to this target instead of probing all
///   WOODY_SLOT        slot for WOODY_TARGET (default: the target's slot)
///
/// Command line options override the environment:
///   --port N  --log-level L  --target NAME  --slot N  --help

#include <woody/client/target.hpp>
#include <woody/log/logger.hpp>
#include <woody/log/macros.hpp>
#include <woody/pine/pine_error.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace woody {

/// Default API port
constexpr uint16_t default_api_port = 6669;

/// Settings of the bridge process
struct bridge_config {
    log::level log_level = log::level::info;
    uint16_t port = default_api_port;

    /// Pinned target; empty probes every known target
    std::string target;

    /// Slot of the pinned target; 0 selects its default slot
    uint16_t slot = 0;

    bool show_help = false;

    /// Environment lookup; nullopt when unset
    using getenv_fn = std::function<std::optional<std::string>(std::string_view)>;

    static std::optional<std::string> host_getenv(std::string_view name) {
        const char* value = std::getenv(std::string(name).c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    }

    /// Build a configuration from the environment, then the command line
    static pine::pine_result<bridge_config> load(int argc, const char* const* argv,
                                                 const getenv_fn& getenv = host_getenv) {
        bridge_config cfg;
        if (auto r = cfg.apply_environment(getenv); !r) {
            return std::unexpected(std::move(r.error()));
        }
        if (auto r = cfg.apply_arguments(argc, argv); !r) {
            return std::unexpected(std::move(r.error()));
        }
        if (auto r = cfg.validate(); !r) {
            return std::unexpected(std::move(r.error()));
        }
        return cfg;
    }

    /// Apply WOODY_* variables
    pine::pine_result<void> apply_environment(const getenv_fn& getenv) {
        if (auto v = getenv("WOODY_LOG_LEVEL"); v && !v->empty()) {
            if (auto lvl = log::parse_level(*v)) {
                log_level = *lvl;
            } else {
                log_level = log::level::info;
                WOODY_LOG_WARNING("unknown WOODY_LOG_LEVEL \"{}\", using info", *v);
            }
        }
        if (auto v = getenv("WOODY_PORT"); v && !v->empty()) {
            auto p = parse_u16("WOODY_PORT", *v, false);
            if (!p) return std::unexpected(std::move(p.error()));
            port = *p;
        }
        if (auto v = getenv("WOODY_TARGET"); v && !v->empty()) {
            target = *v;
        }
        if (auto v = getenv("WOODY_SLOT"); v && !v->empty()) {
            auto s = parse_u16("WOODY_SLOT", *v, true);
            if (!s) return std::unexpected(std::move(s.error()));
            slot = *s;
        }
        return {};
    }

    /// Apply command line options (argv[0] is skipped)
    pine::pine_result<void> apply_arguments(int argc, const char* const* argv) {
        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];
            std::string_view value;

            // Accept both "--opt value" and "--opt=value"
            auto eq = arg.find('=');
            if (arg.starts_with("--") && eq != std::string_view::npos) {
                value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            } else if (takes_value(arg)) {
                if (i + 1 >= argc) {
                    return pine::make_error(pine::pine_errc::invalid_parameter,
                                            fmt::format("option {} requires a value", arg));
                }
                value = argv[++i];
            }

            if (arg == "-h" || arg == "--help") {
                show_help = true;
            } else if (arg == "--port" || arg == "-p") {
                auto p = parse_u16("--port", value, false);
                if (!p) return std::unexpected(std::move(p.error()));
                port = *p;
            } else if (arg == "--log-level") {
                auto lvl = log::parse_level(value);
                if (!lvl) {
                    return pine::make_error(pine::pine_errc::invalid_parameter,
                                            fmt::format("unknown log level \"{}\"", value));
                }
                log_level = *lvl;
            } else if (arg == "--target") {
                target = std::string(value);
            } else if (arg == "--slot") {
                auto s = parse_u16("--slot", value, true);
                if (!s) return std::unexpected(std::move(s.error()));
                slot = *s;
            } else {
                return pine::make_error(pine::pine_errc::invalid_parameter,
                                        fmt::format("unknown option {}", arg));
            }
        }
        return {};
    }

    /// Usage text
    static std::string usage(std::string_view program) {
        return fmt::format(
            "Usage: {} [options]\n"
            "Bridge HTTP requests on 127.0.0.1 to emulators speaking PINE.\n"
            "\n"
            "Options:\n"
            "  -p, --port N         API port (default {}, env WOODY_PORT)\n"
            "      --log-level L    debug, info, warn or error (env WOODY_LOG_LEVEL)\n"
            "      --target NAME    only connect to NAME ({}) (env WOODY_TARGET)\n"
            "      --slot N         slot for --target (env WOODY_SLOT)\n"
            "  -h, --help           show this help\n",
            program, default_api_port, client::known_target_names());
    }

    /// Check the combined settings
    pine::pine_result<void> validate() const {
        // An unknown target is only usable with an explicit slot
        if (!target.empty() && slot == 0 && !client::find_target(target)) {
            return pine::make_error(pine::pine_errc::unknown_target,
                                    fmt::format("unknown target \"{}\"; supported targets are {}",
                                                target, client::known_target_names()));
        }
        return {};
    }

private:
    static bool takes_value(std::string_view arg) noexcept {
        return arg == "--port" || arg == "-p" || arg == "--log-level" ||
               arg == "--target" || arg == "--slot";
    }

    static pine::pine_result<uint16_t> parse_u16(std::string_view name, std::string_view text,
                                                 bool allow_zero) {
        uint16_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size() || (!allow_zero && value == 0)) {
            return pine::make_error(pine::pine_errc::invalid_parameter,
                                    fmt::format("invalid value \"{}\" for {}", text, name));
        }
        return value;
    }
};

} // namespace woody
