/// @file woody_bridge.cpp
/// @brief The bridge daemon
///
/// Keeps a connection to the first reachable emulator (PCSX2, then RPCS3)
/// and serves the HTTP API on 127.0.0.1 until SIGINT or SIGTERM.
///
/// Usage: ./woody_bridge [--port N] [--log-level L] [--target NAME] [--slot N]
///
/// Example:
///   curl 'http://localhost:6669/?woodyRequestType=read32&woodyAddress=0x35459C'
///   curl -H 'Woody-Request-Type: title' http://localhost:6669/

#include <woody/woody.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <cstring>
#include <exception>
#include <system_error>

using namespace woody;

int main(int argc, char* argv[]) {
    auto cfg = bridge_config::load(argc, argv);
    if (!cfg) {
        WOODY_LOG_ERROR("{}", cfg.error().to_string());
        fmt::print(stderr, "{}", bridge_config::usage(argv[0]));
        return 2;
    }
    if (cfg->show_help) {
        fmt::print("{}", bridge_config::usage(argv[0]));
        return 0;
    }

    log::logger::instance().set_level(cfg->log_level);
    WOODY_LOG_INFO("woody {} starting", version());

    if (client::host_platform() == client::platform::other) {
        WOODY_LOG_ERROR("no PINE transport is known for this platform");
        return 1;
    }

    // Block shutdown signals before any thread is spawned so they are only
    // delivered through the signalfd
    signal::signal_set sigs(signal::default_shutdown_signals);
    if (!sigs.block_all_threads()) {
        WOODY_LOG_ERROR("failed to block shutdown signals: {}", std::strerror(errno));
        return 1;
    }

    try {
        signal::signal_fd sigfd(sigs);

        client::session_options session_opts;
        if (!cfg->target.empty()) {
            session_opts.targets = {{cfg->target, cfg->slot}};
            WOODY_LOG_INFO("only connecting to {}", cfg->target);
        } else if (cfg->slot != 0) {
            WOODY_LOG_WARNING("slot {} ignored without a target", cfg->slot);
        }

        client::session_manager session(std::move(session_opts));
        session.start();

        api::server_options server_opts;
        server_opts.port = cfg->port;
        api::api_server server(api::dispatcher(session), server_opts);
        if (auto started = server.start(); !started) {
            WOODY_LOG_ERROR("cannot listen on {}:{}: {}", server_opts.bind_address,
                            server_opts.port, std::strerror(started.error()));
            session.stop();
            return 1;
        }

        auto info = sigfd.wait();
        if (info) {
            WOODY_LOG_INFO("Received {}, shutting down...", info->full_name());
        }

        server.stop();
        session.stop();
    } catch (const std::system_error& e) {
        WOODY_LOG_ERROR("{}", e.what());
        return 1;
    }

    WOODY_LOG_INFO("woody stopped");
    return 0;
}
