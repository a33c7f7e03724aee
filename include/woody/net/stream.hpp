#pragma once

/// @file stream.hpp
/// @brief Blocking stream socket with absolute deadlines
///
/// Every operation takes an absolute deadline and waits with poll() on a
/// non-blocking descriptor, so a silent peer produces ETIMEDOUT instead of
/// blocking the caller forever. Errors are returned as errno values.

#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <expected>
#include <span>
#include <thread>
#include <vector>

namespace woody::net {

using clock = std::chrono::steady_clock;

/// Absolute point in time after which an operation fails with ETIMEDOUT
using deadline = clock::time_point;

/// Deadline a duration from now
inline deadline deadline_after(clock::duration d) {
    return clock::now() + d;
}

namespace detail {

/// Pause between connect attempts while a listener's backlog is full
inline constexpr std::chrono::milliseconds backlog_retry_interval{10};

/// Wait until fd is ready for events or the deadline passes
inline std::expected<void, int> wait_ready(int fd, short events, deadline until) {
    for (;;) {
        auto left = std::chrono::ceil<std::chrono::milliseconds>(until - clock::now());
        if (left.count() <= 0) {
            return std::unexpected(ETIMEDOUT);
        }

        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        int ret = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (ret > 0) {
            return {};
        }
        if (ret < 0 && errno != EINTR) {
            return std::unexpected(errno);
        }
        // Timeout or EINTR: re-check the deadline
    }
}

inline bool set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

} // namespace detail

/// Connected stream socket (Unix domain or TCP)
class stream_socket {
public:
    stream_socket() = default;

    /// Take ownership of a connected descriptor
    explicit stream_socket(int fd) : fd_(fd) {
        if (fd_ >= 0) {
            detail::set_nonblocking(fd_);
        }
    }

    stream_socket(stream_socket&& other) noexcept
        : fd_(other.fd_) {
        other.fd_ = -1;
    }

    stream_socket& operator=(stream_socket&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    ~stream_socket() {
        close();
    }

    stream_socket(const stream_socket&) = delete;
    stream_socket& operator=(const stream_socket&) = delete;

    /// Check if socket is valid
    bool is_valid() const noexcept { return fd_ >= 0; }

    /// Get the file descriptor
    int fd() const noexcept { return fd_; }

    /// Write every byte before the deadline
    std::expected<void, int> write_all(std::span<const uint8_t> data, deadline until) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n >= 0) {
                sent += static_cast<size_t>(n);
                continue;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                return std::unexpected(errno);
            }
            if (auto ready = detail::wait_ready(fd_, POLLOUT, until); !ready) {
                return std::unexpected(ready.error());
            }
        }
        return {};
    }

    /// Read up to buffer.size() bytes; 0 means end of stream
    std::expected<size_t, int> read_some(std::span<uint8_t> buffer, deadline until) {
        for (;;) {
            ssize_t n = ::recv(fd_, buffer.data(), buffer.size(), 0);
            if (n >= 0) {
                return static_cast<size_t>(n);
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                return std::unexpected(errno);
            }
            if (auto ready = detail::wait_ready(fd_, POLLIN, until); !ready) {
                return std::unexpected(ready.error());
            }
        }
    }

    /// Read until the peer closes its write side
    std::expected<std::vector<uint8_t>, int> read_to_end(deadline until) {
        std::vector<uint8_t> out;
        uint8_t chunk[4096];
        for (;;) {
            auto n = read_some(chunk, until);
            if (!n) {
                return std::unexpected(n.error());
            }
            if (*n == 0) {
                return out;
            }
            out.insert(out.end(), chunk, chunk + *n);
        }
    }

    /// Half-close: signal end of request, keep reading
    std::expected<void, int> shutdown_write() {
        if (::shutdown(fd_, SHUT_WR) < 0) {
            return std::unexpected(errno);
        }
        return {};
    }

    /// Close the descriptor (idempotent)
    void close() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

namespace detail {

/// Create a socket and connect it before the deadline
inline std::expected<stream_socket, int> connect_until(int domain,
                                                       const struct sockaddr* sa,
                                                       socklen_t sa_len,
                                                       deadline until) {
    int fd = ::socket(domain, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return std::unexpected(errno);
    }
    stream_socket sock(fd);

    // A Unix socket whose listen backlog is full refuses with EAGAIN and
    // gives nothing to poll for, so the connect is retried until the deadline
    for (;;) {
        if (::connect(fd, sa, sa_len) == 0) {
            return sock;
        }
        if (domain != AF_UNIX || errno != EAGAIN) {
            break;
        }
        auto left = until - clock::now();
        if (left <= clock::duration::zero()) {
            return std::unexpected(ETIMEDOUT);
        }
        std::this_thread::sleep_for(std::min<clock::duration>(left, backlog_retry_interval));
    }
    if (errno != EINPROGRESS && errno != EINTR) {
        return std::unexpected(errno);
    }

    if (auto ready = wait_ready(fd, POLLOUT, until); !ready) {
        return std::unexpected(ready.error());
    }

    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        return std::unexpected(errno);
    }
    if (err != 0) {
        return std::unexpected(err);
    }
    return sock;
}

/// Accept one connection on a listening descriptor before the deadline
inline std::expected<stream_socket, int> accept_until(int listen_fd, deadline until) {
    for (;;) {
        int fd = ::accept4(listen_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd >= 0) {
            return stream_socket(fd);
        }
        if (errno == EINTR || errno == ECONNABORTED) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            return std::unexpected(errno);
        }
        if (auto ready = wait_ready(listen_fd, POLLIN, until); !ready) {
            return std::unexpected(ready.error());
        }
    }
}

} // namespace detail

} // namespace woody::net
