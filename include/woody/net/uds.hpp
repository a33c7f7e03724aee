#pragma once

/// @file uds.hpp
/// @brief Unix domain stream sockets: address, connector, listener

#include "stream.hpp"

#include <woody/log/macros.hpp>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <expected>
#include <string>
#include <string_view>

namespace woody::net {

/// Unix Domain Socket options
struct uds_options {
    int backlog = 128;           ///< Listen backlog
    bool unlink_on_bind = true;  ///< Unlink existing socket file before bind
};

/// Unix socket address wrapper
struct unix_address {
    std::string path;

    unix_address() = default;

    /// Construct from path string
    explicit unix_address(std::string_view p) : path(p) {}

    /// Convert to sockaddr_un; ENAMETOOLONG if the path does not fit
    std::expected<struct sockaddr_un, int> to_sockaddr() const {
        struct sockaddr_un sa{};
        sa.sun_family = AF_UNIX;

        if (path.size() >= sizeof(sa.sun_path)) {
            return std::unexpected(ENAMETOOLONG);
        }
        std::memcpy(sa.sun_path, path.data(), path.size());
        sa.sun_path[path.size()] = '\0';
        return sa;
    }

    /// Get sockaddr length (filesystem socket, including the terminator)
    socklen_t sockaddr_len() const {
        return static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) + path.size() + 1);
    }

    std::string to_string() const {
        return path.empty() ? "(unnamed)" : path;
    }
};

/// Connect to a Unix Domain Socket server before the deadline
inline std::expected<stream_socket, int> uds_connect(const unix_address& addr, deadline until) {
    auto sa = addr.to_sockaddr();
    if (!sa) {
        return std::unexpected(sa.error());
    }
    auto sock = detail::connect_until(AF_UNIX, reinterpret_cast<const struct sockaddr*>(&*sa),
                                      addr.sockaddr_len(), until);
    if (sock) {
        WOODY_LOG_DEBUG("Connected to {}", addr.to_string());
    }
    return sock;
}

/// Unix Domain Socket listener for accepting connections
class uds_listener {
public:
    /// Create and bind a Unix Domain Socket listener
    /// @param addr Address (path) to bind to
    /// @param opts Socket options
    /// @return listener on success, errno on error
    static std::expected<uds_listener, int> bind(const unix_address& addr,
                                                 const uds_options& opts = {}) {
        auto sa = addr.to_sockaddr();
        if (!sa) {
            return std::unexpected(sa.error());
        }

        int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            return std::unexpected(errno);
        }

        if (opts.unlink_on_bind && !addr.path.empty()) {
            ::unlink(addr.path.c_str());
        }

        if (::bind(fd, reinterpret_cast<const struct sockaddr*>(&*sa), addr.sockaddr_len()) < 0) {
            int err = errno;
            ::close(fd);
            return std::unexpected(err);
        }

        if (::listen(fd, opts.backlog) < 0) {
            int err = errno;
            ::close(fd);
            ::unlink(addr.path.c_str());
            return std::unexpected(err);
        }

        WOODY_LOG_DEBUG("UDS listener bound to {}", addr.to_string());

        return uds_listener(fd, addr);
    }

    uds_listener(uds_listener&& other) noexcept
        : fd_(other.fd_)
        , local_addr_(std::move(other.local_addr_)) {
        other.fd_ = -1;
    }

    uds_listener& operator=(uds_listener&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            local_addr_ = std::move(other.local_addr_);
            other.fd_ = -1;
        }
        return *this;
    }

    ~uds_listener() {
        close();
    }

    uds_listener(const uds_listener&) = delete;
    uds_listener& operator=(const uds_listener&) = delete;

    /// Check if listener is valid
    bool is_valid() const noexcept { return fd_ >= 0; }

    /// Get the file descriptor
    int fd() const noexcept { return fd_; }

    /// Get local address
    const unix_address& local_address() const noexcept { return local_addr_; }

    /// Accept a connection; ETIMEDOUT if none arrives before the deadline
    std::expected<stream_socket, int> accept(deadline until) {
        return detail::accept_until(fd_, until);
    }

    /// Close the listener and remove its socket file
    void close() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
            if (!local_addr_.path.empty()) {
                ::unlink(local_addr_.path.c_str());
            }
        }
    }

private:
    uds_listener(int fd, const unix_address& addr)
        : fd_(fd), local_addr_(addr) {}

    int fd_ = -1;
    unix_address local_addr_;
};

} // namespace woody::net
