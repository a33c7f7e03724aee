#pragma once

/// @file session.hpp
/// @brief Keeps exactly one validated emulator connection alive
///
/// The session manager owns two independent pieces of state:
///   - the connection slot: the active connection (if any) and the session
///     state, guarded by its own mutex and never held across an exchange;
///   - the supervisor thread: probes the configured targets in order while
///     disconnected, sleeps the retry interval between rounds, and parks
///     while connected until a call site reports a failure.
///
/// State machine:
///   disconnected --probe round--> probing(target) --success--> connected(target)
///        ^                               |
///        +---- no target reachable ------+   (retry after retry_interval)
///   connected --report_failure--> disconnected

#include "connection.hpp"
#include "resolver.hpp"
#include "target.hpp"

#include <woody/log/macros.hpp>
#include <woody/pine/pine.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace woody::client {

/// Session states
enum class session_state {
    disconnected,
    probing,
    connected,
};

inline const char* session_state_str(session_state s) {
    switch (s) {
        case session_state::disconnected: return "disconnected";
        case session_state::probing: return "probing";
        case session_state::connected: return "connected";
        default: return "unknown";
    }
}

/// A target the session may connect to; slot 0 means the target's default
struct session_target {
    std::string name;
    uint16_t slot = 0;
};

/// Every known target on its default slot, in probe order
inline std::vector<session_target> default_session_targets() {
    std::vector<session_target> targets;
    for (const auto& t : known_targets) {
        targets.push_back({std::string(t.name), t.default_slot});
    }
    return targets;
}

/// Session manager configuration
struct session_options {
    /// Wait between probe rounds that found no reachable target
    std::chrono::milliseconds retry_interval{std::chrono::seconds(5)};

    /// Targets in probe order
    std::vector<session_target> targets = default_session_targets();

    resolver_environment env;
    connection_options connection;
};

/// Supervisor of the single active emulator connection
class session_manager {
public:
    explicit session_manager(session_options opts = {})
        : opts_(std::move(opts))
        , exchange_lock_(make_exchange_lock()) {}

    ~session_manager() {
        stop();
    }

    session_manager(const session_manager&) = delete;
    session_manager& operator=(const session_manager&) = delete;

    /// Start the supervisor thread (no-op if already running)
    void start() {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        if (supervisor_.joinable()) {
            return;
        }
        stopping_ = false;
        supervisor_ = std::thread([this] { supervise(); });
    }

    /// Stop the supervisor thread and wait for it to exit
    void stop() {
        {
            std::lock_guard<std::mutex> lock(slot_mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (supervisor_.joinable()) {
            supervisor_.join();
        }
    }

    /// Run one probe round over all targets
    /// @return true if a target was reached and is now active
    bool probe_once() {
        probe_rounds_.fetch_add(1, std::memory_order_relaxed);
        WOODY_LOG_INFO("trying to connect to known emulators");

        for (const auto& t : opts_.targets) {
            {
                std::lock_guard<std::mutex> lock(slot_mutex_);
                if (stopping_) {
                    break;
                }
                state_ = session_state::probing;
                target_name_ = t.name;
            }
            WOODY_LOG_INFO("trying to connect to {}", t.name);

            auto conn = connection::open(t.name, t.slot, opts_.env, exchange_lock_, opts_.connection);
            if (!conn) {
                WOODY_LOG_ERROR("cannot resolve target {}: {}", t.name, conn.error().to_string());
                continue;
            }

            if (auto probed = conn->probe(); !probed) {
                WOODY_LOG_INFO("test connection for {} failed: {}", t.name, probed.error().to_string());
                continue;
            }

            WOODY_LOG_INFO("test connection for {} succeeded ({})", t.name, conn->descriptor().address());
            {
                std::lock_guard<std::mutex> lock(slot_mutex_);
                active_ = std::make_shared<const connection>(std::move(*conn));
                state_ = session_state::connected;
                target_name_ = t.name;
            }
            cv_.notify_all();
            return true;
        }

        std::lock_guard<std::mutex> lock(slot_mutex_);
        active_.reset();
        state_ = session_state::disconnected;
        target_name_.clear();
        return false;
    }

    /// Active connection, or nullptr while not connected
    std::shared_ptr<const connection> current() const {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        return active_;
    }

    session_state state() const {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        return state_;
    }

    /// Name of the connected target
    std::optional<std::string> active_target() const {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        if (state_ != session_state::connected) {
            return std::nullopt;
        }
        return target_name_;
    }

    /// Demote to disconnected after a transport failure
    /// @param failed The connection that failed; ignored if it is no longer
    ///        active. nullptr demotes whatever connection is active.
    void report_failure(const connection* failed = nullptr) {
        {
            std::lock_guard<std::mutex> lock(slot_mutex_);
            if (!active_ || (failed && failed != active_.get())) {
                return;
            }
            WOODY_LOG_WARNING("connection to {} failed, reconnecting", target_name_);
            active_.reset();
            state_ = session_state::disconnected;
            target_name_.clear();
        }
        cv_.notify_all();
    }

    /// Block until connected or the timeout elapses
    template<typename Rep, typename Period>
    bool wait_until_connected(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(slot_mutex_);
        return cv_.wait_for(lock, timeout, [this] {
            return state_ == session_state::connected;
        });
    }

    /// Exchange on the active connection; transport failures demote the session
    pine_result<pine::pine_answer> exchange(const pine::pine_request& request) {
        auto conn = current();
        if (!conn) {
            return make_error(pine_errc::not_connected, "no emulator connection");
        }
        auto answer = conn->exchange(request);
        if (!answer && answer.error().is_transport()) {
            report_failure(conn.get());
        }
        return answer;
    }

    /// Number of probe rounds started so far
    uint64_t probe_rounds() const noexcept {
        return probe_rounds_.load(std::memory_order_relaxed);
    }

    const session_options& options() const noexcept { return opts_; }

private:
    void supervise() {
        WOODY_LOG_DEBUG("session supervisor started");
        for (;;) {
            {
                std::unique_lock<std::mutex> lock(slot_mutex_);
                cv_.wait(lock, [this] {
                    return stopping_ || state_ != session_state::connected;
                });
                if (stopping_) {
                    break;
                }
            }

            if (probe_once()) {
                continue;
            }

            WOODY_LOG_INFO("could not connect to any target, retrying in {} ms",
                           opts_.retry_interval.count());
            std::unique_lock<std::mutex> lock(slot_mutex_);
            if (cv_.wait_for(lock, opts_.retry_interval, [this] { return stopping_; })) {
                break;
            }
        }
        WOODY_LOG_DEBUG("session supervisor stopped");
    }

    session_options opts_;
    exchange_lock exchange_lock_;

    mutable std::mutex slot_mutex_;
    std::condition_variable cv_;
    std::shared_ptr<const connection> active_;
    session_state state_ = session_state::disconnected;
    std::string target_name_;
    bool stopping_ = false;

    std::atomic<uint64_t> probe_rounds_{0};
    std::thread supervisor_;
};

} // namespace woody::client
