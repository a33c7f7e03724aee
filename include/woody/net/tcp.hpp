#pragma once

/// @file tcp.hpp
/// @brief IPv4 TCP stream sockets: address, connector, listener
///
/// Only numeric IPv4 addresses are accepted; the bridge talks to loopback
/// endpoints exclusively and never resolves host names.

#include "stream.hpp"

#include <woody/log/macros.hpp>

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace woody::net {

/// TCP socket options
struct tcp_options {
    bool reuse_addr = true;      ///< SO_REUSEADDR
    bool no_delay = true;        ///< TCP_NODELAY (disable Nagle's algorithm)
    int backlog = 128;           ///< Listen backlog
};

/// IPv4 address wrapper (network byte order address, host byte order port)
struct ipv4_address {
    uint32_t addr = htonl(INADDR_LOOPBACK);
    uint16_t port = 0;

    ipv4_address() = default;

    ipv4_address(uint32_t a, uint16_t p) : addr(a), port(p) {}

    explicit ipv4_address(const struct sockaddr_in& sa)
        : addr(sa.sin_addr.s_addr), port(ntohs(sa.sin_port)) {}

    /// 127.0.0.1:port
    static ipv4_address loopback(uint16_t port) {
        return ipv4_address(htonl(INADDR_LOOPBACK), port);
    }

    /// Parse a dotted-quad address
    static std::optional<ipv4_address> parse(std::string_view ip, uint16_t port) {
        struct in_addr in{};
        if (::inet_pton(AF_INET, std::string(ip).c_str(), &in) != 1) {
            return std::nullopt;
        }
        return ipv4_address(in.s_addr, port);
    }

    struct sockaddr_in to_sockaddr() const {
        struct sockaddr_in sa{};
        sa.sin_family = AF_INET;
        sa.sin_addr.s_addr = addr;
        sa.sin_port = htons(port);
        return sa;
    }

    std::string to_string() const {
        char buf[INET_ADDRSTRLEN];
        struct in_addr in{};
        in.s_addr = addr;
        ::inet_ntop(AF_INET, &in, buf, sizeof(buf));
        return std::string(buf) + ":" + std::to_string(port);
    }
};

/// Connect to a TCP server before the deadline
inline std::expected<stream_socket, int> tcp_connect(const ipv4_address& addr, deadline until,
                                                     const tcp_options& opts = {}) {
    auto sa = addr.to_sockaddr();
    auto sock = detail::connect_until(AF_INET, reinterpret_cast<const struct sockaddr*>(&sa),
                                      sizeof(sa), until);
    if (!sock) {
        return sock;
    }
    if (opts.no_delay) {
        int flag = 1;
        ::setsockopt(sock->fd(), IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    }
    WOODY_LOG_DEBUG("Connected to {}", addr.to_string());
    return sock;
}

/// TCP listener for accepting connections
class tcp_listener {
public:
    /// Create and bind a TCP listener
    /// @param addr Address to bind to; port 0 picks an ephemeral port
    /// @param opts Socket options
    /// @return listener on success, errno on error
    static std::expected<tcp_listener, int> bind(const ipv4_address& addr,
                                                 const tcp_options& opts = {}) {
        int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            return std::unexpected(errno);
        }

        if (opts.reuse_addr) {
            int flag = 1;
            ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag));
        }

        auto sa = addr.to_sockaddr();
        if (::bind(fd, reinterpret_cast<struct sockaddr*>(&sa), sizeof(sa)) < 0) {
            int err = errno;
            ::close(fd);
            return std::unexpected(err);
        }

        if (::listen(fd, opts.backlog) < 0) {
            int err = errno;
            ::close(fd);
            return std::unexpected(err);
        }

        // Report the port actually bound when an ephemeral one was requested
        struct sockaddr_in bound{};
        socklen_t len = sizeof(bound);
        ipv4_address local = addr;
        if (::getsockname(fd, reinterpret_cast<struct sockaddr*>(&bound), &len) == 0) {
            local = ipv4_address(bound);
        }

        WOODY_LOG_DEBUG("TCP listener bound to {}", local.to_string());

        return tcp_listener(fd, local, opts);
    }

    tcp_listener(tcp_listener&& other) noexcept
        : fd_(other.fd_)
        , local_addr_(other.local_addr_)
        , opts_(other.opts_) {
        other.fd_ = -1;
    }

    tcp_listener& operator=(tcp_listener&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            local_addr_ = other.local_addr_;
            opts_ = other.opts_;
            other.fd_ = -1;
        }
        return *this;
    }

    ~tcp_listener() {
        close();
    }

    tcp_listener(const tcp_listener&) = delete;
    tcp_listener& operator=(const tcp_listener&) = delete;

    /// Check if listener is valid
    bool is_valid() const noexcept { return fd_ >= 0; }

    /// Get the file descriptor
    int fd() const noexcept { return fd_; }

    /// Get local address (with the bound port)
    const ipv4_address& local_address() const noexcept { return local_addr_; }

    /// Accept a connection; ETIMEDOUT if none arrives before the deadline
    std::expected<stream_socket, int> accept(deadline until) {
        auto sock = detail::accept_until(fd_, until);
        if (sock && opts_.no_delay) {
            int flag = 1;
            ::setsockopt(sock->fd(), IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
        }
        return sock;
    }

    /// Close the listener
    void close() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    tcp_listener(int fd, const ipv4_address& addr, const tcp_options& opts)
        : fd_(fd), local_addr_(addr), opts_(opts) {}

    int fd_ = -1;
    ipv4_address local_addr_;
    tcp_options opts_;
};

} // namespace woody::net
