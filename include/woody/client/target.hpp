#pragma once

/// @file target.hpp
/// @brief Registry of emulator targets that speak PINE

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace woody::client {

/// An emulator that exposes a PINE endpoint
struct target {
    std::string_view name;
    uint16_t default_slot;
};

/// Known targets, in the order the session manager probes them
inline constexpr std::array<target, 2> known_targets = {{
    {"pcsx2", 28011},   // PCSX2 PINE.h
    {"rpcs3", 28012},   // RPCS3 IPC_config.h
}};

/// Find a target by exact name
constexpr const target* find_target(std::string_view name) noexcept {
    for (const auto& t : known_targets) {
        if (t.name == name) {
            return &t;
        }
    }
    return nullptr;
}

/// Known target names joined for diagnostics: "pcsx2, rpcs3"
inline std::string known_target_names() {
    std::string out;
    for (const auto& t : known_targets) {
        if (!out.empty()) {
            out += ", ";
        }
        out += t.name;
    }
    return out;
}

} // namespace woody::client
