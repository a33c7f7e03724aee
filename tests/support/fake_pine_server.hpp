#pragma once

/// @file fake_pine_server.hpp
/// @brief Scripted PINE endpoint for integration tests
///
/// Accepts on a Unix socket path or an ephemeral loopback TCP port, reads
/// each request until the client half-closes, records it and writes back
/// whatever the responder returns. Each connection is served on its own
/// thread so tests can observe whether clients overlap.

#include <woody/net/stream.hpp>
#include <woody/net/tcp.hpp>
#include <woody/net/uds.hpp>
#include <woody/pine/pine_buffer.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace woody::test {

class fake_pine_server {
public:
    /// Builds the answer frame for a request frame
    using responder = std::function<std::vector<uint8_t>(std::span<const uint8_t>)>;

    /// Listen on a Unix socket path; nullptr if binding fails
    static std::unique_ptr<fake_pine_server> listen_unix(const std::string& path, responder r) {
        auto listener = net::uds_listener::bind(net::unix_address(path));
        if (!listener) {
            return nullptr;
        }
        std::unique_ptr<fake_pine_server> server(new fake_pine_server(std::move(r)));
        server->uds_.emplace(std::move(*listener));
        server->run();
        return server;
    }

    /// Listen on 127.0.0.1 with an ephemeral port; nullptr if binding fails
    static std::unique_ptr<fake_pine_server> listen_tcp(responder r) {
        auto listener = net::tcp_listener::bind(net::ipv4_address::loopback(0));
        if (!listener) {
            return nullptr;
        }
        std::unique_ptr<fake_pine_server> server(new fake_pine_server(std::move(r)));
        server->tcp_.emplace(std::move(*listener));
        server->run();
        return server;
    }

    ~fake_pine_server() {
        stop();
    }

    fake_pine_server(const fake_pine_server&) = delete;
    fake_pine_server& operator=(const fake_pine_server&) = delete;

    /// Stop accepting, finish in-flight connections and remove the socket file
    void stop() {
        stopping_ = true;
        if (acceptor_.joinable()) {
            acceptor_.join();
        }
        std::vector<std::thread> handlers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handlers.swap(handlers_);
        }
        for (auto& t : handlers) {
            t.join();
        }
        uds_.reset();
        tcp_.reset();
    }

    /// Accept connections but never answer; the client times out
    void set_silent(bool silent) {
        silent_ = silent;
    }

    uint16_t port() const {
        return tcp_ ? tcp_->local_address().port : 0;
    }

    /// Request frames received so far (empty ones come from probes)
    std::vector<std::vector<uint8_t>> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    /// Non-empty request frames received so far
    size_t exchange_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(requests_.begin(), requests_.end(),
                                                 [](const auto& r) { return !r.empty(); }));
    }

    size_t connection_count() const {
        return connections_.load();
    }

    /// Largest number of connections that were being served at once
    int max_in_flight() const {
        return max_in_flight_.load();
    }

private:
    explicit fake_pine_server(responder r)
        : responder_(std::move(r)) {}

    void run() {
        acceptor_ = std::thread([this] { accept_loop(); });
    }

    void accept_loop() {
        while (!stopping_) {
            auto until = net::deadline_after(std::chrono::milliseconds(50));
            auto sock = uds_ ? uds_->accept(until) : tcp_->accept(until);
            if (!sock) {
                continue;
            }
            connections_.fetch_add(1);
            std::lock_guard<std::mutex> lock(mutex_);
            handlers_.emplace_back([this, s = std::move(*sock)]() mutable {
                serve(std::move(s));
            });
        }
    }

    void serve(net::stream_socket sock) {
        int now = in_flight_.fetch_add(1) + 1;
        int seen = max_in_flight_.load();
        while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {
        }

        if (silent_) {
            // Hold the connection open until the test shuts the server down
            while (!stopping_) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            in_flight_.fetch_sub(1);
            return;
        }

        auto request = sock.read_to_end(net::deadline_after(std::chrono::seconds(5)));
        if (!request) {
            in_flight_.fetch_sub(1);
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(*request);
        }

        if (!request->empty()) {
            auto reply = responder_(*request);
            if (!reply.empty()) {
                if (auto r = sock.write_all(reply, net::deadline_after(std::chrono::seconds(5))); !r) {
                    in_flight_.fetch_sub(1);
                    return;
                }
            }
        }
        // Leave in-flight before the close lets the client's next exchange start
        in_flight_.fetch_sub(1);
    }

    responder responder_;
    std::optional<net::uds_listener> uds_;
    std::optional<net::tcp_listener> tcp_;

    std::atomic<bool> stopping_{false};
    std::atomic<bool> silent_{false};
    std::atomic<size_t> connections_{0};
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_in_flight_{0};

    mutable std::mutex mutex_;
    std::vector<std::vector<uint8_t>> requests_;
    std::vector<std::thread> handlers_;
    std::thread acceptor_;
};

/// Answer frame: length prefix, result code, payload
inline std::vector<uint8_t> answer_frame(uint8_t result_code, std::vector<uint8_t> payload = {}) {
    std::vector<uint8_t> frame(5 + payload.size());
    pine::store_le<uint32_t>(frame.data(), static_cast<uint32_t>(frame.size()));
    frame[4] = result_code;
    std::copy(payload.begin(), payload.end(), frame.begin() + 5);
    return frame;
}

/// String answer frame with a NUL-terminated text
inline std::vector<uint8_t> text_frame(uint8_t result_code, std::string_view text) {
    std::vector<uint8_t> payload(4);
    pine::store_le<uint32_t>(payload.data(), static_cast<uint32_t>(text.size() + 1));
    payload.insert(payload.end(), text.begin(), text.end());
    payload.push_back(0);
    return answer_frame(result_code, std::move(payload));
}

/// A well-behaved emulator with fixed memory and metadata
///   read8 -> 0x45, read32 -> 0x12345678, other reads fail
///   writes and save/load state succeed
///   title "Woody Test", version "1.2", status running
inline std::vector<uint8_t> canned_answer(std::span<const uint8_t> request) {
    if (request.size() < 5) {
        return {};
    }
    switch (request[4]) {
        case 0:
            return answer_frame(0x00, {0x45});
        case 2:
            return answer_frame(0x00, {0x78, 0x56, 0x34, 0x12});
        case 1:
        case 3:
            return answer_frame(0xFF);
        case 4: case 5: case 6: case 7: case 9: case 10:
            return answer_frame(0x00);
        case 8:
            return text_frame(0x00, "1.2");
        case 11:
            return text_frame(0x00, "Woody Test");
        case 12:
            return text_frame(0x00, "SLUS-20000");
        case 13:
            return text_frame(0x00, "0123abcd");
        case 14:
            return text_frame(0x00, "1.00");
        case 15:
            return answer_frame(0x00, {0x00, 0x00, 0x00, 0x00});
        default:
            return answer_frame(0xFF);
    }
}

} // namespace woody::test
