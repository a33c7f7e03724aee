#pragma once

/// woody - PINE emulator bridge - Main Header
///
/// This header provides convenient access to all woody components.

// Version information
#define WOODY_VERSION_MAJOR 0
#define WOODY_VERSION_MINOR 1
#define WOODY_VERSION_PATCH 0

// Logging
#include "log/logger.hpp"
#include "log/macros.hpp"
#include "log/hex_dump.hpp"

// PINE wire protocol
#include "pine/pine.hpp"

// Sockets
#include "net/stream.hpp"
#include "net/tcp.hpp"
#include "net/uds.hpp"

// Emulator client
#include "client/target.hpp"
#include "client/resolver.hpp"
#include "client/connection.hpp"
#include "client/session.hpp"

// HTTP API
#include "api/http_common.hpp"
#include "api/http_parser.hpp"
#include "api/dispatcher.hpp"
#include "api/api_server.hpp"

// Process plumbing
#include "signal/signalfd.hpp"
#include "config.hpp"

#include <tuple>

/// Root namespace of the bridge
namespace woody {

/// Get version string
inline const char* version() noexcept {
    return "0.1.0";
}

/// Get version as tuple
inline constexpr auto version_tuple() noexcept {
    return std::make_tuple(WOODY_VERSION_MAJOR, WOODY_VERSION_MINOR, WOODY_VERSION_PATCH);
}

} // namespace woody
