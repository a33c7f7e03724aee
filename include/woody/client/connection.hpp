#pragma once

/// @file connection.hpp
/// @brief One PINE exchange per physical connection
///
/// A connection holds no socket between calls. Every send() dials a fresh
/// socket, writes the request, half-closes the write side, reads the answer
/// until the emulator closes, and closes the socket. All connections created
/// by one session share an exchange lock, so at most one exchange is in
/// flight and exchanges are served in lock-acquisition order.

#include "resolver.hpp"

#include <woody/log/hex_dump.hpp>
#include <woody/log/macros.hpp>
#include <woody/net/stream.hpp>
#include <woody/net/tcp.hpp>
#include <woody/net/uds.hpp>
#include <woody/pine/pine.hpp>

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <span>
#include <utility>
#include <vector>

namespace woody::client {

/// Connection options
struct connection_options {
    /// Bound on dialing the emulator, fallback path included
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(15)};

    /// Deadline for writing the request and reading the answer, set once dialed
    std::chrono::milliseconds exchange_timeout{std::chrono::seconds(15)};
};

/// Lock serializing every exchange in the process
using exchange_lock = std::shared_ptr<std::mutex>;

/// Create a fresh exchange lock
inline exchange_lock make_exchange_lock() {
    return std::make_shared<std::mutex>();
}

/// Map an errno from the socket layer to a pine_error
inline pine::pine_error transport_error(int err, std::string_view what,
                                        const transport_descriptor& desc) {
    auto code = err == ETIMEDOUT ? pine_errc::timeout : pine_errc::io_error;
    return pine::pine_error(code,
                            fmt::format("{} {} at \"{}\": {}", what, desc.target,
                                        desc.address(), std::strerror(err)),
                            err);
}

/// Reusable descriptor for exchanges with one emulator endpoint
class connection {
public:
    explicit connection(transport_descriptor desc,
                        exchange_lock lock = make_exchange_lock(),
                        connection_options opts = {})
        : desc_(std::move(desc))
        , lock_(std::move(lock))
        , opts_(opts) {}

    /// Resolve a target and build a connection to it
    static pine_result<connection> open(std::string_view target_name,
                                        uint16_t slot = 0,
                                        const resolver_environment& env = {},
                                        exchange_lock lock = make_exchange_lock(),
                                        connection_options opts = {}) {
        auto desc = resolve(target_name, slot, env);
        if (!desc) {
            return std::unexpected(std::move(desc.error()));
        }
        return connection(std::move(*desc), std::move(lock), opts);
    }

    /// Resolved endpoint
    const transport_descriptor& descriptor() const noexcept { return desc_; }

    /// Shared exchange lock
    const exchange_lock& lock() const noexcept { return lock_; }

    const connection_options& options() const noexcept { return opts_; }

    /// Send one request frame and return the raw answer frame
    pine_result<std::vector<uint8_t>> send(std::span<const uint8_t> request) const {
        std::lock_guard<std::mutex> guard(*lock_);

        WOODY_LOG_DEBUG("request bytes for {}:\n{}", desc_.target, log::hex_dump(request));

        auto sock = dial(net::deadline_after(opts_.connect_timeout));
        if (!sock) {
            return std::unexpected(std::move(sock.error()));
        }

        auto until = net::deadline_after(opts_.exchange_timeout);
        if (auto r = sock->write_all(request, until); !r) {
            return std::unexpected(transport_error(r.error(), "writing request to", desc_));
        }
        if (auto r = sock->shutdown_write(); !r) {
            return std::unexpected(transport_error(r.error(), "half-closing connection to", desc_));
        }
        WOODY_LOG_DEBUG("request written to {}", desc_.address());

        auto answer = sock->read_to_end(until);
        if (!answer) {
            return std::unexpected(transport_error(answer.error(), "reading answer from", desc_));
        }

        WOODY_LOG_DEBUG("answer bytes from {}:\n{}", desc_.target, log::hex_dump(*answer));
        return std::move(*answer);
    }

    /// Open and close a connection without exchanging any payload
    pine_result<void> probe() const {
        auto sock = dial(net::deadline_after(opts_.connect_timeout));
        if (!sock) {
            return std::unexpected(std::move(sock.error()));
        }
        return {};
    }

    /// Encode a request, send it and decode the answer
    pine_result<pine::pine_answer> exchange(const pine::pine_request& request) const {
        auto frame = pine::encode(request);
        if (!frame) {
            return std::unexpected(std::move(frame.error()));
        }
        auto reply = send(*frame);
        if (!reply) {
            return std::unexpected(std::move(reply.error()));
        }
        return pine::decode(pine::opcode_of(request), *reply);
    }

    /// Typed exchange: the answer type follows from the request type
    template<pine::request_type Request>
    pine_result<typename Request::answer_type> exchange(const Request& request) const {
        auto answer = exchange(pine::pine_request(request));
        if (!answer) {
            return std::unexpected(std::move(answer.error()));
        }
        return std::get<typename Request::answer_type>(std::move(*answer));
    }

private:
    /// Dial the primary address, then the slot-less socket path
    pine_result<net::stream_socket> dial(net::deadline until) const {
        if (desc_.kind == transport_kind::loopback_port) {
            auto sock = net::tcp_connect(net::ipv4_address::loopback(desc_.port), until);
            if (!sock) {
                return make_error(pine_errc::connection_failed,
                                  fmt::format("could not connect to PINE for {} at \"{}\": {}",
                                              desc_.target, desc_.address(),
                                              std::strerror(sock.error())),
                                  sock.error());
            }
            return std::move(*sock);
        }

        auto sock = net::uds_connect(net::unix_address(desc_.primary_path), until);
        if (sock) {
            return std::move(*sock);
        }
        int primary_err = sock.error();
        WOODY_LOG_DEBUG("dial {} failed ({}), trying {}", desc_.primary_path,
                        std::strerror(primary_err), desc_.secondary_path);

        if (!desc_.secondary_path.empty()) {
            auto fallback = net::uds_connect(net::unix_address(desc_.secondary_path), until);
            if (fallback) {
                return std::move(*fallback);
            }
        }

        return make_error(pine_errc::connection_failed,
                          fmt::format("could not connect to PINE for {} at \"{}\": {}",
                                      desc_.target, desc_.primary_path,
                                      std::strerror(primary_err)),
                          primary_err);
    }

    transport_descriptor desc_;
    exchange_lock lock_;
    connection_options opts_;
};

} // namespace woody::client
