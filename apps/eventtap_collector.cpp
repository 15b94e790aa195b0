#include "eventtap/core/server/IngestionServer.h"
#include "eventtap/core/event/EventStore.h"
#include "eventtap/core/util/Env.h"
#include "eventtap/core/util/Logger.h"
#include "eventtap/core/Error.h"
#include <fmt/format.h>
#include <string>
#include <iostream>
#include <vector>
#include <thread>
#include <chrono>
#include <csignal>

using namespace eventtap::core::server;
using namespace eventtap::core::util;

namespace {
volatile std::sig_atomic_t stop_requested = 0;
void on_signal(int) { stop_requested = 1; }

void print_help() {
    std::cout << "Usage: eventtap_collector [--host H] [--port N] [--workers N] [--log-level L] [--log-file path]" << std::endl;
    std::cout << "                          [--name-field F] [--name-fallback dotted.path]" << std::endl;
    std::cout << "  Defaults come from EVENTTAP_SERVER_HOST / EVENTTAP_SERVER_PORT (127.0.0.1:8000)." << std::endl;
}
}

int main(int argc, char** argv) {
    ServerConfig cfg = ServerConfig::from_env();
    Logger::Level level = parse_level(env_string("EVENTTAP_LOG_LEVEL", "info"));
    std::string logFile = env_string("EVENTTAP_LOG_FILE", "");
    std::vector<std::string> args(argv + 1, argv + argc);
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        bool hasValue = i + 1 < args.size();
        if (a == "--help" || a == "-h") { print_help(); return 0; }
        if (a == "--host" && hasValue) { cfg.host = args[++i]; continue; }
        if ((a == "--port" || a == "-p") && hasValue) {
            int p = -1;
            try { p = std::stoi(args[++i]); } catch (const std::exception&) { p = -1; }
            if (p < 0 || p > 65535) { std::cerr << "invalid port: " << args[i] << std::endl; return 2; }
            cfg.port = static_cast<uint16_t>(p); continue;
        }
        if (a == "--workers" && hasValue) {
            int n = 0;
            try { n = std::stoi(args[++i]); } catch (const std::exception&) { n = 0; }
            if (n <= 0) { std::cerr << "invalid worker count: " << args[i] << std::endl; return 2; }
            cfg.worker_threads = static_cast<unsigned>(n); continue;
        }
        if (a == "--log-level" && hasValue) { level = parse_level(args[++i]); continue; }
        if (a == "--log-file" && hasValue) { logFile = args[++i]; continue; }
        if (a == "--name-field" && hasValue) { cfg.name_field = args[++i]; continue; }
        if (a == "--name-fallback" && hasValue) { cfg.name_fallback_path = args[++i]; continue; }
        std::cerr << "unknown or incomplete option: " << a << std::endl;
        print_help();
        return 2;
    }
    Logger::instance().set_level(level);
    if (!logFile.empty() && !Logger::instance().set_file(logFile)) {
        std::cerr << "cannot open log file " << logFile << std::endl;
    }
    eventtap::core::event::EventStore store;
    IngestionServer server(store, cfg);
    try {
        server.start();
    } catch (const eventtap::core::SetupError& e) {
        log_error(e.what());
        return 1;
    }
    log_info(fmt::format("collector ready at {}", server.base_url()));
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    while (!stop_requested) std::this_thread::sleep_for(std::chrono::milliseconds(200));
    server.stop();
    log_info(fmt::format("stopped with {} events stored", store.size()));
    return 0;
}
