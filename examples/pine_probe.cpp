/// @file pine_probe.cpp
/// @brief Send one PINE request from the command line
///
/// Finds an emulator the same way the bridge does (or uses --target),
/// performs a single exchange and prints the answer as JSON.
///
/// Usage: ./pine_probe [--target NAME] [--slot N] OPERATION [address=A] [data=D] [slot=S]
///
/// Examples:
///   ./pine_probe status
///   ./pine_probe read32 address=0x35459C
///   ./pine_probe --target pcsx2 write8 address=0x35459C data=0x45
///   ./pine_probe savestate slot=1

#include <woody/woody.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <string>
#include <string_view>

using namespace woody;

namespace {

void print_usage(const char* program) {
    fmt::print(stderr,
               "Usage: {} [--target NAME] [--slot N] OPERATION [address=A] [data=D] [slot=S]\n"
               "Operations: ",
               program);
    for (size_t i = 0; i < pine::operation_table.size(); ++i) {
        fmt::print(stderr, "{}{}", i ? " " : "", pine::operation_table[i].name);
    }
    fmt::print(stderr, "\n");
}

} // namespace

int main(int argc, char* argv[]) {
    bridge_config cfg;
    if (auto r = cfg.apply_environment(bridge_config::host_getenv); !r) {
        WOODY_LOG_ERROR("{}", r.error().to_string());
        return 2;
    }
    log::logger::instance().set_level(cfg.log_level);

    api::api_request call;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if ((arg == "--target" || arg == "--slot") && i + 1 < argc) {
            const char* opt[] = {argv[0], argv[i], argv[i + 1]};
            if (auto r = cfg.apply_arguments(3, opt); !r) {
                WOODY_LOG_ERROR("{}", r.error().to_string());
                return 2;
            }
            ++i;
        } else if (auto eq = arg.find('='); eq != std::string_view::npos) {
            call.params["woody" + api::normalize_key(arg.substr(0, eq))] = std::string(arg.substr(eq + 1));
        } else if (call.operation.empty()) {
            call.operation = api::to_lower(arg);
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }
    if (call.operation.empty()) {
        print_usage(argv[0]);
        return 2;
    }
    if (auto r = cfg.validate(); !r) {
        WOODY_LOG_ERROR("{}", r.error().to_string());
        return 2;
    }

    auto request = api::build_request(call);
    if (!request) {
        WOODY_LOG_ERROR("{}", request.error().message);
        return 2;
    }

    client::session_options opts;
    if (!cfg.target.empty()) {
        opts.targets = {{cfg.target, cfg.slot}};
    }
    client::session_manager session(std::move(opts));
    if (!session.probe_once()) {
        WOODY_LOG_ERROR("no emulator reachable");
        return 1;
    }

    auto answer = session.exchange(*request);
    if (!answer) {
        WOODY_LOG_ERROR("{}", answer.error().to_string());
        if (answer.error().code == pine::pine_errc::malformed_frame) {
            fmt::print(stderr, "{}", log::hex_dump(answer.error().frame));
        }
        return 1;
    }

    fmt::print("{}\n", api::answer_to_json(*answer));
    return pine::succeeded(*answer) ? 0 : 3;
}
