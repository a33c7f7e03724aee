#pragma once

/// @file api_server.hpp
/// @brief Loopback HTTP listener for the bridge API
///
/// One thread accepts connections; each accepted connection is served on its
/// own thread (one request per connection, "Connection: close"). Exchanges
/// with the emulator are serialized further down by the exchange lock, so
/// concurrent HTTP requests simply queue there.

#include "dispatcher.hpp"
#include "http_common.hpp"
#include "http_parser.hpp"

#include <woody/log/macros.hpp>
#include <woody/net/stream.hpp>
#include <woody/net/tcp.hpp>

#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <expected>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace woody::api {

/// Listener configuration
struct server_options {
    std::string bind_address = "127.0.0.1";
    uint16_t port = 6669;

    /// Time allowed for receiving a request and sending its response
    std::chrono::milliseconds io_timeout{std::chrono::seconds(10)};

    /// How often the accept loop checks for stop()
    std::chrono::milliseconds accept_poll{std::chrono::milliseconds(200)};

    parser_limits limits;
};

/// Serialize a response with the fixed bridge headers
inline std::string serialize_response(const api_response& resp) {
    return fmt::format("HTTP/1.1 {} {}\r\n"
                       "Content-Type: {}\r\n"
                       "Content-Length: {}\r\n"
                       "Connection: close\r\n"
                       "\r\n"
                       "{}",
                       static_cast<uint16_t>(resp.code), status_reason(resp.code),
                       json_content_type, resp.body.size(), resp.body);
}

/// HTTP front end of the bridge
class api_server {
public:
    explicit api_server(dispatcher handler, server_options opts = {})
        : handler_(std::move(handler))
        , opts_(std::move(opts)) {}

    ~api_server() {
        stop();
    }

    api_server(const api_server&) = delete;
    api_server& operator=(const api_server&) = delete;

    /// Bind the listener and start accepting
    /// @return errno if the address is invalid or cannot be bound
    std::expected<void, int> start() {
        auto addr = net::ipv4_address::parse(opts_.bind_address, opts_.port);
        if (!addr) {
            return std::unexpected(EINVAL);
        }
        auto listener = net::tcp_listener::bind(*addr);
        if (!listener) {
            return std::unexpected(listener.error());
        }
        listener_.emplace(std::move(*listener));
        stopping_ = false;

        WOODY_LOG_INFO("API server listening on {}", listener_->local_address().to_string());
        acceptor_ = std::thread([this] { accept_loop(); });
        return {};
    }

    /// Stop accepting and wait for in-flight requests
    void stop() {
        stopping_ = true;
        if (acceptor_.joinable()) {
            acceptor_.join();
        }
        std::list<worker> workers;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers.swap(workers_);
        }
        for (auto& w : workers) {
            if (w.thread.joinable()) {
                w.thread.join();
            }
        }
        if (listener_) {
            listener_.reset();
            WOODY_LOG_INFO("API server stopped");
        }
    }

    /// Bound port (resolves port 0 to the ephemeral port picked)
    uint16_t port() const noexcept {
        return listener_ ? listener_->local_address().port : opts_.port;
    }

    /// Number of connections currently being served
    size_t active_workers() const {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        size_t n = 0;
        for (const auto& w : workers_) {
            if (!w.done->load(std::memory_order_acquire)) {
                ++n;
            }
        }
        return n;
    }

private:
    struct worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop() {
        while (!stopping_) {
            auto sock = listener_->accept(net::deadline_after(opts_.accept_poll));
            reap_workers();
            if (!sock) {
                if (sock.error() != ETIMEDOUT) {
                    WOODY_LOG_WARNING("accept failed: {}", std::strerror(sock.error()));
                    std::this_thread::sleep_for(opts_.accept_poll);
                }
                continue;
            }

            auto done = std::make_shared<std::atomic<bool>>(false);
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers_.push_back({
                std::thread([this, s = std::move(*sock), done]() mutable {
                    serve_connection(std::move(s));
                    done->store(true, std::memory_order_release);
                }),
                done});
        }
    }

    /// Join workers that have finished
    void reap_workers() {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load(std::memory_order_acquire)) {
                it->thread.join();
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void serve_connection(net::stream_socket sock) {
        auto until = net::deadline_after(opts_.io_timeout);
        request_parser parser(opts_.limits);
        char buf[4096];

        for (;;) {
            auto n = sock.read_some(std::span<uint8_t>(reinterpret_cast<uint8_t*>(buf), sizeof(buf)), until);
            if (!n) {
                if (n.error() == ETIMEDOUT) {
                    respond(sock, until, error_response(status::request_timeout, "timed out reading HTTP request"));
                } else {
                    WOODY_LOG_DEBUG("read from API client failed: {}", std::strerror(n.error()));
                }
                return;
            }
            if (*n == 0) {
                WOODY_LOG_DEBUG("API client closed before sending a complete request");
                return;
            }

            auto result = parser.feed(std::string_view(buf, *n));
            if (result == parse_result::need_more) {
                continue;
            }
            if (result == parse_result::error) {
                WOODY_LOG_ERROR("could not parse HTTP request: {}", parser.error_message());
                respond(sock, until, error_response(parser.error_status(),
                                                    fmt::format("could not parse HTTP request: {}",
                                                                parser.error_message())));
                return;
            }
            break;
        }

        const auto& req = parser.request();
        WOODY_LOG_INFO("handling HTTP {} {}", req.method_token, req.path);

        if (req.kind == method::other) {
            respond(sock, until, error_response(status::method_not_allowed,
                                                "only GET and POST are supported"));
            return;
        }

        respond(sock, until, handler_.handle(req));
    }

    void respond(net::stream_socket& sock, net::deadline until, const api_response& resp) {
        auto text = serialize_response(resp);
        auto bytes = std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size());
        if (auto r = sock.write_all(bytes, until); !r) {
            WOODY_LOG_WARNING("could not send HTTP response: {}", std::strerror(r.error()));
            return;
        }
        if (auto r = sock.shutdown_write(); !r) {
            WOODY_LOG_DEBUG("half-close of API connection failed: {}", std::strerror(r.error()));
        }
    }

    dispatcher handler_;
    server_options opts_;
    std::optional<net::tcp_listener> listener_;
    std::atomic<bool> stopping_{false};
    std::thread acceptor_;

    mutable std::mutex workers_mutex_;
    std::list<worker> workers_;
};

} // namespace woody::api
