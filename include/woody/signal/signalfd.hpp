#pragma once

/// @file signalfd.hpp
/// @brief Synchronous signal handling using signalfd
///
/// Signals are blocked in every thread and delivered as reads from a
/// signalfd, so the main thread can simply wait for SIGINT/SIGTERM and then
/// stop the listener and the session supervisor in order.
///
/// Usage:
/// @code
/// woody::signal::signal_set sigs{SIGINT, SIGTERM};
/// sigs.block_all_threads();               // before spawning any thread
/// woody::signal::signal_fd sigfd(sigs);
/// auto info = sigfd.wait();
/// @endcode

#include <woody/log/macros.hpp>

#include <csignal>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <pthread.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace woody::signal {

/// Information about a received signal
struct signal_info {
    int signo = 0;          ///< Signal number
    uint32_t pid = 0;       ///< PID of sending process

    signal_info() noexcept = default;

    explicit signal_info(const signalfd_siginfo& ssi) noexcept
        : signo(static_cast<int>(ssi.ssi_signo))
        , pid(ssi.ssi_pid) {}

    /// Get full signal name (e.g., "SIGINT")
    std::string full_name() const {
        const char* abbrev = sigabbrev_np(signo);
        if (abbrev) {
            return std::string("SIG") + abbrev;
        }
        return "SIG" + std::to_string(signo);
    }
};

/// Set of signals to handle via signalfd
class signal_set {
public:
    signal_set() noexcept {
        sigemptyset(&mask_);
    }

    signal_set(std::initializer_list<int> signals) noexcept {
        sigemptyset(&mask_);
        for (int sig : signals) {
            sigaddset(&mask_, sig);
        }
    }

    /// Add a signal to the set
    signal_set& add(int signo) noexcept {
        sigaddset(&mask_, signo);
        return *this;
    }

    /// Check if a signal is in the set
    bool contains(int signo) const noexcept {
        return sigismember(&mask_, signo) == 1;
    }

    const sigset_t& mask() const noexcept {
        return mask_;
    }

    /// Block these signals for the calling thread and every thread it spawns
    /// afterwards; call early in main()
    bool block_all_threads() const noexcept {
        return pthread_sigmask(SIG_BLOCK, &mask_, nullptr) == 0;
    }

private:
    sigset_t mask_;
};

/// Signal file descriptor; the signals must already be blocked
class signal_fd {
public:
    /// @throws std::system_error if signalfd creation fails
    explicit signal_fd(const signal_set& signals)
        : signals_(signals) {
        fd_ = ::signalfd(-1, &signals_.mask(), SFD_CLOEXEC);
        if (fd_ < 0) {
            throw std::system_error(errno, std::system_category(), "signalfd creation failed");
        }
        WOODY_LOG_DEBUG("signal_fd created with fd={}", fd_);
    }

    ~signal_fd() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    signal_fd(const signal_fd&) = delete;
    signal_fd& operator=(const signal_fd&) = delete;

    signal_fd(signal_fd&& other) noexcept
        : fd_(std::exchange(other.fd_, -1))
        , signals_(other.signals_) {}

    int fd() const noexcept { return fd_; }

    const signal_set& signals() const noexcept { return signals_; }

    /// Block until one of the signals arrives
    /// @return nullopt if reading the signalfd failed
    std::optional<signal_info> wait() {
        signalfd_siginfo siginfo{};
        for (;;) {
            ssize_t n = ::read(fd_, &siginfo, sizeof(siginfo));
            if (n == static_cast<ssize_t>(sizeof(siginfo))) {
                return signal_info(siginfo);
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            WOODY_LOG_ERROR("signalfd read failed: {}", n < 0 ? std::strerror(errno) : "short read");
            return std::nullopt;
        }
    }

private:
    int fd_ = -1;
    signal_set signals_;
};

/// Default shutdown signals
inline constexpr std::initializer_list<int> default_shutdown_signals = {SIGINT, SIGTERM};

} // namespace woody::signal
