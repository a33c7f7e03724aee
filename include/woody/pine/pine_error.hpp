#pragma once

/// @file pine_error.hpp
/// @brief Error values for the PINE core
///
/// Every fallible operation in the core returns
/// `std::expected<T, pine_error>`. Configuration errors (bad target), transport
/// errors (dial/write/read/timeout) and decode errors (bad frame) share one
/// error type so callers can log and map them uniformly.

#include <fmt/format.h>

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace woody::pine {

/// Error codes for PINE operations
enum class pine_errc : uint32_t {
    invalid_target = 1,
    unknown_target = 2,
    unsupported_platform = 3,
    unknown_operation = 4,
    invalid_parameter = 5,
    malformed_frame = 6,
    connection_failed = 7,
    timeout = 8,
    io_error = 9,
    not_connected = 10,
    internal = 11,
};

/// Convert error code to string
inline const char* pine_errc_str(pine_errc err) {
    switch (err) {
        case pine_errc::invalid_target: return "invalid target";
        case pine_errc::unknown_target: return "unknown target";
        case pine_errc::unsupported_platform: return "unsupported platform";
        case pine_errc::unknown_operation: return "unknown operation";
        case pine_errc::invalid_parameter: return "invalid parameter";
        case pine_errc::malformed_frame: return "malformed frame";
        case pine_errc::connection_failed: return "connection failed";
        case pine_errc::timeout: return "timeout";
        case pine_errc::io_error: return "i/o error";
        case pine_errc::not_connected: return "not connected";
        case pine_errc::internal: return "internal error";
        default: return "unknown error";
    }
}

/// Error value carried by every failed PINE result
struct pine_error {
    pine_errc code = pine_errc::internal;
    std::string message;

    /// errno of the failed system call (transport errors only)
    int sys_errno = 0;

    /// Offending frame and the lengths that would have been accepted
    /// (malformed_frame only). An empty list with min_length set means
    /// "at least min_length".
    std::vector<uint8_t> frame;
    std::vector<uint32_t> expected_lengths;
    uint32_t min_length = 0;

    pine_error() = default;

    pine_error(pine_errc c, std::string msg, int err = 0)
        : code(c), message(std::move(msg)), sys_errno(err) {}

    /// Transport errors are the only ones that say something about the peer
    bool is_transport() const noexcept {
        return code == pine_errc::connection_failed ||
               code == pine_errc::timeout ||
               code == pine_errc::io_error;
    }

    std::string to_string() const {
        if (message.empty()) {
            return pine_errc_str(code);
        }
        return fmt::format("{}: {}", pine_errc_str(code), message);
    }
};

/// Result of a PINE operation
template<typename T>
using pine_result = std::expected<T, pine_error>;

/// Build an unexpected pine_error in one expression
inline std::unexpected<pine_error> make_error(pine_errc code, std::string message, int err = 0) {
    return std::unexpected(pine_error(code, std::move(message), err));
}

} // namespace woody::pine
