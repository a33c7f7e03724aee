#pragma once

/// @file opcodes.hpp
/// @brief Static catalog of the sixteen PINE operations
///
/// Each operation has a numeric opcode (0-15, contiguous, as in the PINE
/// draft), an API name, a request field layout and the set of answer frame
/// lengths it accepts. The codec is driven entirely by this table.
///
/// Request frame:  [u32 total length][u8 opcode][address][data | slot]
/// Answer frame:   [u32 total length][u8 result code][payload]

#include "pine_error.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace woody::pine {

/// PINE opcodes
enum class opcode : uint8_t {
    read8 = 0,
    read16 = 1,
    read32 = 2,
    read64 = 3,
    write8 = 4,
    write16 = 5,
    write32 = 6,
    write64 = 7,
    version = 8,
    save_state = 9,
    load_state = 10,
    title = 11,
    id = 12,
    uuid = 13,
    game_version = 14,
    status = 15,
};

constexpr size_t opcode_count = 16;

/// Size of the length prefix
constexpr uint32_t length_field_size = 4;

/// Length prefix plus the opcode (requests) or result code (answers)
constexpr uint32_t frame_header_size = 5;

/// Smallest accepted string answer: header + u32 string length + 1 byte
constexpr uint32_t text_answer_min_length = 10;

/// Result codes carried in the first answer payload byte
constexpr uint8_t result_ok = 0x00;
constexpr uint8_t result_fail = 0xFF;

/// What follows the result code in an answer frame
enum class answer_shape : uint8_t {
    result_only,      ///< nothing (writes, save/load state)
    memory_value,     ///< value_bytes wide integer, absent on failure (reads)
    optional_status,  ///< optional u32 (status)
    text,             ///< u32 length + bytes (version/title/id/uuid/game version)
};

/// Field layout of one operation
struct operation_layout {
    opcode code;
    std::string_view name;      ///< API name, e.g. "read32"
    uint8_t address_bytes;      ///< 4 for memory operations, else 0
    uint8_t data_bytes;         ///< write width in bytes, else 0
    uint8_t slot_bytes;         ///< 1 for save/load state, else 0
    answer_shape shape;
    uint8_t value_bytes;        ///< width of the answer value, if any

    /// Exact length of the request frame
    constexpr uint32_t request_length() const noexcept {
        return frame_header_size + address_bytes + data_bytes + slot_bytes;
    }

    /// Smallest answer frame this operation accepts
    constexpr uint32_t min_answer_length() const noexcept {
        return shape == answer_shape::text ? text_answer_min_length : frame_header_size;
    }

    /// Check an answer frame's declared length
    constexpr bool accepts_answer_length(uint32_t length) const noexcept {
        switch (shape) {
            case answer_shape::result_only:
                return length == frame_header_size;
            case answer_shape::memory_value:
            case answer_shape::optional_status:
                return length == frame_header_size ||
                       length == frame_header_size + value_bytes;
            case answer_shape::text:
                return length >= text_answer_min_length;
        }
        return false;
    }

    /// Exact accepted answer lengths; empty for text answers (see min_answer_length)
    std::vector<uint32_t> exact_answer_lengths() const {
        switch (shape) {
            case answer_shape::result_only:
                return {frame_header_size};
            case answer_shape::memory_value:
            case answer_shape::optional_status:
                return {frame_header_size, frame_header_size + value_bytes};
            case answer_shape::text:
                break;
        }
        return {};
    }

    /// Human-readable accepted length set, e.g. "{5, 9}" or ">= 10"
    std::string accepted_lengths_string() const {
        if (shape == answer_shape::text) {
            return fmt::format(">= {}", text_answer_min_length);
        }
        return fmt::format("{{{}}}", fmt::join(exact_answer_lengths(), ", "));
    }
};

/// The catalog, indexed by opcode value
inline constexpr std::array<operation_layout, opcode_count> operation_table = {{
    {opcode::read8,        "read8",       4, 0, 0, answer_shape::memory_value,    1},
    {opcode::read16,       "read16",      4, 0, 0, answer_shape::memory_value,    2},
    {opcode::read32,       "read32",      4, 0, 0, answer_shape::memory_value,    4},
    {opcode::read64,       "read64",      4, 0, 0, answer_shape::memory_value,    8},
    {opcode::write8,       "write8",      4, 1, 0, answer_shape::result_only,     0},
    {opcode::write16,      "write16",     4, 2, 0, answer_shape::result_only,     0},
    {opcode::write32,      "write32",     4, 4, 0, answer_shape::result_only,     0},
    {opcode::write64,      "write64",     4, 8, 0, answer_shape::result_only,     0},
    {opcode::version,      "version",     0, 0, 0, answer_shape::text,            0},
    {opcode::save_state,   "savestate",   0, 0, 1, answer_shape::result_only,     0},
    {opcode::load_state,   "loadstate",   0, 0, 1, answer_shape::result_only,     0},
    {opcode::title,        "title",       0, 0, 0, answer_shape::text,            0},
    {opcode::id,           "id",          0, 0, 0, answer_shape::text,            0},
    {opcode::uuid,         "uuid",        0, 0, 0, answer_shape::text,            0},
    {opcode::game_version, "gameversion", 0, 0, 0, answer_shape::text,            0},
    {opcode::status,       "status",      0, 0, 0, answer_shape::optional_status, 4},
}};

namespace detail {

constexpr bool table_is_indexed_by_opcode() {
    for (size_t i = 0; i < operation_table.size(); ++i) {
        if (static_cast<size_t>(operation_table[i].code) != i) {
            return false;
        }
    }
    return true;
}

} // namespace detail

static_assert(detail::table_is_indexed_by_opcode(), "operation_table out of order");

/// Layout of an opcode
constexpr const operation_layout& layout_of(opcode op) noexcept {
    return operation_table[static_cast<size_t>(op)];
}

/// API name of an opcode
constexpr std::string_view opcode_name(opcode op) noexcept {
    return layout_of(op).name;
}

/// Look up an operation by API name (case-insensitive)
inline pine_result<const operation_layout*> find_operation(std::string_view name) {
    for (const auto& layout : operation_table) {
        if (layout.name.size() != name.size()) {
            continue;
        }
        bool match = true;
        for (size_t i = 0; i < name.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(name[i])) != layout.name[i]) {
                match = false;
                break;
            }
        }
        if (match) {
            return &layout;
        }
    }
    return make_error(pine_errc::unknown_operation,
                      fmt::format("unknown operation \"{}\"", name));
}

/// Look up an operation by raw opcode byte
inline pine_result<const operation_layout*> find_operation_by_code(uint8_t code) {
    if (code >= opcode_count) {
        return make_error(pine_errc::unknown_operation,
                          fmt::format("unknown opcode {}", code));
    }
    return &operation_table[code];
}

} // namespace woody::pine
