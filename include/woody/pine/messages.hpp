#pragma once

/// @file messages.hpp
/// @brief Typed PINE requests and answers
///
/// Requests and answers are closed sets of sixteen variants each. Every
/// variant carries only the fields its wire layout needs and names its
/// opcode as a static member, so one table-driven codec serves them all.
///
/// Usage:
/// @code
/// pine_request req = read32_request{0x35459C};
/// auto bytes = encode(req);                       // 09 00 00 00 02 9C 45 35 00
/// auto answer = decode(opcode::read32, reply);    // read32_answer
/// @endcode

#include "opcodes.hpp"

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace woody::pine {

// ============================================================================
// Answers
// ============================================================================

/// Answer to a memory read; memory_value is zero when the emulator failed
template<opcode Op, std::unsigned_integral T>
struct read_answer {
    static constexpr opcode code = Op;
    using value_type = T;

    uint8_t result_code = result_fail;
    T memory_value = 0;
};

/// Answer carrying only a result code (writes, save/load state)
template<opcode Op>
struct ack_answer {
    static constexpr opcode code = Op;

    uint8_t result_code = result_fail;
};

/// Answer carrying a NUL-trimmed string (version/title/id/uuid/game version)
template<opcode Op>
struct text_answer {
    static constexpr opcode code = Op;

    uint8_t result_code = result_fail;
    std::string text;
};

/// Answer to a status query; status is present only in the 9-byte form
struct status_answer {
    static constexpr opcode code = opcode::status;

    uint8_t result_code = result_fail;
    std::optional<uint32_t> status;
};

using read8_answer = read_answer<opcode::read8, uint8_t>;
using read16_answer = read_answer<opcode::read16, uint16_t>;
using read32_answer = read_answer<opcode::read32, uint32_t>;
using read64_answer = read_answer<opcode::read64, uint64_t>;
using write8_answer = ack_answer<opcode::write8>;
using write16_answer = ack_answer<opcode::write16>;
using write32_answer = ack_answer<opcode::write32>;
using write64_answer = ack_answer<opcode::write64>;
using version_answer = text_answer<opcode::version>;
using save_state_answer = ack_answer<opcode::save_state>;
using load_state_answer = ack_answer<opcode::load_state>;
using title_answer = text_answer<opcode::title>;
using id_answer = text_answer<opcode::id>;
using uuid_answer = text_answer<opcode::uuid>;
using game_version_answer = text_answer<opcode::game_version>;

/// Any PINE answer; alternatives are ordered by opcode
using pine_answer = std::variant<
    read8_answer, read16_answer, read32_answer, read64_answer,
    write8_answer, write16_answer, write32_answer, write64_answer,
    version_answer, save_state_answer, load_state_answer,
    title_answer, id_answer, uuid_answer, game_version_answer,
    status_answer>;

static_assert(std::variant_size_v<pine_answer> == opcode_count);

// ============================================================================
// Requests
// ============================================================================

/// Memory read at a 32-bit address
template<opcode Op, std::unsigned_integral T>
struct read_request {
    static constexpr opcode code = Op;
    using answer_type = read_answer<Op, T>;

    uint32_t address = 0;
};

/// Memory write; the data width matches the opcode
template<opcode Op, std::unsigned_integral T>
struct write_request {
    static constexpr opcode code = Op;
    using answer_type = ack_answer<Op>;
    using value_type = T;

    uint32_t address = 0;
    T data = 0;
};

/// Save-state or load-state on an emulator save slot
template<opcode Op>
struct state_request {
    static constexpr opcode code = Op;
    using answer_type = ack_answer<Op>;

    uint8_t slot = 0;
};

/// Request with no arguments
template<opcode Op, typename Answer>
struct query_request {
    static constexpr opcode code = Op;
    using answer_type = Answer;
};

using read8_request = read_request<opcode::read8, uint8_t>;
using read16_request = read_request<opcode::read16, uint16_t>;
using read32_request = read_request<opcode::read32, uint32_t>;
using read64_request = read_request<opcode::read64, uint64_t>;
using write8_request = write_request<opcode::write8, uint8_t>;
using write16_request = write_request<opcode::write16, uint16_t>;
using write32_request = write_request<opcode::write32, uint32_t>;
using write64_request = write_request<opcode::write64, uint64_t>;
using version_request = query_request<opcode::version, version_answer>;
using save_state_request = state_request<opcode::save_state>;
using load_state_request = state_request<opcode::load_state>;
using title_request = query_request<opcode::title, title_answer>;
using id_request = query_request<opcode::id, id_answer>;
using uuid_request = query_request<opcode::uuid, uuid_answer>;
using game_version_request = query_request<opcode::game_version, game_version_answer>;
using status_request = query_request<opcode::status, status_answer>;

/// Any PINE request; alternatives are ordered by opcode
using pine_request = std::variant<
    read8_request, read16_request, read32_request, read64_request,
    write8_request, write16_request, write32_request, write64_request,
    version_request, save_state_request, load_state_request,
    title_request, id_request, uuid_request, game_version_request,
    status_request>;

static_assert(std::variant_size_v<pine_request> == opcode_count);

/// A concrete request alternative
template<typename T>
concept request_type = requires {
    { T::code } -> std::convertible_to<opcode>;
    typename T::answer_type;
};

// ============================================================================
// Accessors
// ============================================================================

/// Opcode of a request
inline opcode opcode_of(const pine_request& request) noexcept {
    return std::visit([](const auto& r) { return std::decay_t<decltype(r)>::code; }, request);
}

/// Opcode of an answer
inline opcode opcode_of(const pine_answer& answer) noexcept {
    return std::visit([](const auto& a) { return std::decay_t<decltype(a)>::code; }, answer);
}

/// Result code of an answer
inline uint8_t result_code_of(const pine_answer& answer) noexcept {
    return std::visit([](const auto& a) { return a.result_code; }, answer);
}

/// Whether the emulator reported success
inline bool succeeded(const pine_answer& answer) noexcept {
    return result_code_of(answer) == result_ok;
}

// ============================================================================
// Emulator status
// ============================================================================

/// Values of the status answer as defined by the PINE draft
enum class emulator_status : uint32_t {
    running = 0,
    paused = 1,
    shutdown = 2,
};

/// Name of a status value ("unknown" for values outside the draft)
inline const char* emulator_status_str(uint32_t status) noexcept {
    switch (static_cast<emulator_status>(status)) {
        case emulator_status::running: return "running";
        case emulator_status::paused: return "paused";
        case emulator_status::shutdown: return "shutdown";
        default: return "unknown";
    }
}

} // namespace woody::pine
