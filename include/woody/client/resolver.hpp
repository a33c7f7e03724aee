#pragma once

/// @file resolver.hpp
/// @brief Map an emulator target and slot to a transport endpoint
///
/// PINE endpoints live at a per-target stream socket path on Linux and macOS:
///
///   $XDG_RUNTIME_DIR/<target>.sock.<slot>   (Linux)
///   $TMPDIR/<target>.sock.<slot>            (macOS)
///   /tmp/<target>.sock.<slot>               (variable unset or empty)
///
/// and at loopback TCP port <slot> on Windows. Emulators do not agree on
/// whether the default slot is appended to the socket name, so the resolver
/// always appends it and records the slot-less name as a secondary candidate
/// that the connection dials only when the primary fails.

#include "target.hpp"

#include <woody/pine/pine_error.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace woody::client {

using pine::make_error;
using pine::pine_errc;
using pine::pine_result;

/// Host platform families the resolver distinguishes
enum class platform {
    gnu_linux,
    macos,
    windows,
    other,
};

/// Platform this binary was compiled for
constexpr platform host_platform() noexcept {
#if defined(_WIN32)
    return platform::windows;
#elif defined(__APPLE__)
    return platform::macos;
#elif defined(__linux__)
    return platform::gnu_linux;
#else
    return platform::other;
#endif
}

/// Platform and environment the resolver consults; replaceable in tests
struct resolver_environment {
    platform os = host_platform();

    /// Environment lookup; nullopt when unset
    std::function<std::optional<std::string>(std::string_view)> getenv =
        [](std::string_view name) -> std::optional<std::string> {
            const char* value = std::getenv(std::string(name).c_str());
            if (!value) {
                return std::nullopt;
            }
            return std::string(value);
        };

    /// The real host
    static resolver_environment host() { return {}; }
};

/// Transport kinds
enum class transport_kind {
    stream_socket_path,  ///< Unix domain stream socket
    loopback_port,       ///< TCP on 127.0.0.1
};

/// Resolved endpoint of one target/slot pair
struct transport_descriptor {
    std::string target;
    uint16_t slot = 0;
    transport_kind kind = transport_kind::stream_socket_path;

    /// Socket path (stream_socket_path only)
    std::string primary_path;

    /// Slot-less socket path tried after the primary fails (stream_socket_path only)
    std::string secondary_path;

    /// TCP port (loopback_port only)
    uint16_t port = 0;

    /// Primary address for diagnostics
    std::string address() const {
        if (kind == transport_kind::loopback_port) {
            return fmt::format("127.0.0.1:{}", port);
        }
        return primary_path;
    }
};

/// Directory that holds PINE sockets on this platform
inline std::string socket_directory(const resolver_environment& env) {
    const char* variable = nullptr;
    if (env.os == platform::gnu_linux) {
        variable = "XDG_RUNTIME_DIR";
    } else if (env.os == platform::macos) {
        variable = "TMPDIR";
    }
    if (variable) {
        auto value = env.getenv(variable);
        if (value && !value->empty()) {
            return *value;
        }
    }
    return "/tmp";
}

/// Resolve a target to its transport endpoint
/// @param target_name Target name, e.g. "pcsx2"
/// @param slot Slot override; 0 selects the target's default slot
/// @param env Platform and environment to resolve against
inline pine_result<transport_descriptor> resolve(std::string_view target_name,
                                                 uint16_t slot = 0,
                                                 const resolver_environment& env = {}) {
    if (target_name.empty()) {
        return make_error(pine_errc::invalid_target, "empty target name");
    }

    if (slot == 0) {
        const target* t = find_target(target_name);
        if (!t) {
            return make_error(pine_errc::unknown_target,
                              fmt::format("unknown target \"{}\"; supported targets are {}",
                                          target_name, known_target_names()));
        }
        slot = t->default_slot;
    }

    transport_descriptor desc;
    desc.target = std::string(target_name);
    desc.slot = slot;

    switch (env.os) {
        case platform::windows:
            desc.kind = transport_kind::loopback_port;
            desc.port = slot;
            return desc;

        case platform::gnu_linux:
        case platform::macos: {
            desc.kind = transport_kind::stream_socket_path;
            desc.primary_path = fmt::format("{}/{}.sock.{}", socket_directory(env), target_name, slot);
            desc.secondary_path = desc.primary_path.substr(0, desc.primary_path.rfind('.'));
            return desc;
        }

        case platform::other:
            break;
    }
    return make_error(pine_errc::unsupported_platform,
                      fmt::format("no PINE transport for target \"{}\" on this platform", target_name));
}

} // namespace woody::client
