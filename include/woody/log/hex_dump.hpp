#pragma once

/// @file hex_dump.hpp
/// @brief Canonical hex+ASCII rendering of wire frames for debug logs
///
/// Output format (16 bytes per line):
///   00000000  09 00 00 00 02 9c 45 35  00                       |......E5.|

#include <fmt/format.h>

#include <cstdint>
#include <iterator>
#include <span>
#include <string>

namespace woody::log {

/// Render bytes as an offset/hex/ASCII dump, one line per 16 bytes
inline std::string hex_dump(std::span<const uint8_t> bytes) {
    std::string out;
    out.reserve((bytes.size() / 16 + 1) * 79);

    for (size_t offset = 0; offset < bytes.size(); offset += 16) {
        fmt::format_to(std::back_inserter(out), "{:08x} ", offset);

        for (size_t i = 0; i < 16; ++i) {
            if (i == 8) {
                out += ' ';
            }
            if (offset + i < bytes.size()) {
                fmt::format_to(std::back_inserter(out), " {:02x}", bytes[offset + i]);
            } else {
                out += "   ";
            }
        }

        out += "  |";
        for (size_t i = 0; i < 16 && offset + i < bytes.size(); ++i) {
            uint8_t c = bytes[offset + i];
            out += (c >= 0x20 && c < 0x7f) ? static_cast<char>(c) : '.';
        }
        out += "|\n";
    }

    return out;
}

/// Render bytes as space-separated hex on a single line ("09 00 00 00 02")
inline std::string hex_string(std::span<const uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size() * 3);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i != 0) {
            out += ' ';
        }
        fmt::format_to(std::back_inserter(out), "{:02x}", bytes[i]);
    }
    return out;
}

} // namespace woody::log
