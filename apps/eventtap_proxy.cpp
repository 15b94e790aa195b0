#include "eventtap/core/proxy/ProxyServer.h"
#include "eventtap/core/proxy/TransactionLogObserver.h"
#include "eventtap/core/proxy/MirrorAddon.h"
#include "eventtap/core/util/Env.h"
#include "eventtap/core/util/Logger.h"
#include "eventtap/core/Error.h"
#include <fmt/format.h>
#include <string>
#include <iostream>
#include <fstream>
#include <vector>
#include <optional>
#include <thread>
#include <chrono>
#include <csignal>

using namespace eventtap::core::proxy;
using namespace eventtap::core::util;

namespace {
volatile std::sig_atomic_t stop_requested = 0;
void on_signal(int) { stop_requested = 1; }

void print_help() {
    std::cout << "Usage: eventtap_proxy [--port N|-p N] [--log-level L] [--log-file path]" << std::endl;
    std::cout << "                      [--enable-mitm] [--ca-cert path] [--ca-key path] [--regenerate-ca]" << std::endl;
    std::cout << "                      [--mitm-allow globs] [--mitm-deny globs] [--export-ca file] [--export-ca-der file]" << std::endl;
    std::cout << "                      [--target-host H] [--target-path P] [--collector-url U] [--no-mirror]" << std::endl;
    std::cout << "  Matching requests are copied to the collector; flags override EVENTTAP_* environment." << std::endl;
    std::cout << "  Use --enable-mitm to intercept HTTPS (tunneling by default)." << std::endl;
}

std::optional<uint16_t> parse_port(const std::string& v) {
    try {
        std::size_t used = 0;
        int p = std::stoi(v, &used);
        if (used != v.size() || p < 0 || p > 65535) return std::nullopt;
        return static_cast<uint16_t>(p);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f.write(content.data(), static_cast<std::streamsize>(content.size()));
    return static_cast<bool>(f);
}
}

int main(int argc, char** argv) {
    std::optional<uint16_t> envPort = parse_port(env_string("EVENTTAP_PROXY_PORT", "9090"));
    uint16_t port = envPort ? *envPort : 9090;
    Logger::Level level = parse_level(env_string("EVENTTAP_LOG_LEVEL", "info"));
    std::string logFile = env_string("EVENTTAP_LOG_FILE", "");
    std::vector<std::string> args(argv + 1, argv + argc);
    Config cfg;
    MirrorConfig mirrorCfg = MirrorConfig::from_env();
    std::string exportCaFile; std::string exportCaDerFile;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        bool hasValue = i + 1 < args.size();
        if (a == "--help" || a == "-h") { print_help(); return 0; }
        if ((a == "--port" || a == "-p") && hasValue) {
            auto p = parse_port(args[++i]);
            if (!p) { std::cerr << "invalid port: " << args[i] << std::endl; return 2; }
            port = *p; continue;
        }
        if (a == "--log-level" && hasValue) { level = parse_level(args[++i]); continue; }
        if (a == "--log-file" && hasValue) { logFile = args[++i]; continue; }
        if (a == "--enable-mitm") { cfg.enableTlsMitm = true; continue; }
        if (a == "--regenerate-ca") { cfg.regenerateCa = true; continue; }
        if (a == "--ca-cert" && hasValue) { cfg.caCertPath = args[++i]; continue; }
        if (a == "--ca-key" && hasValue) { cfg.caKeyPath = args[++i]; continue; }
        if (a == "--mitm-allow" && hasValue) { cfg.mitmAllowList = args[++i]; continue; }
        if (a == "--mitm-deny" && hasValue) { cfg.mitmDenyList = args[++i]; continue; }
        if (a == "--export-ca" && hasValue) { exportCaFile = args[++i]; continue; }
        if (a == "--export-ca-der" && hasValue) { exportCaDerFile = args[++i]; continue; }
        if (a == "--target-host" && hasValue) { mirrorCfg.target_host = args[++i]; continue; }
        if (a == "--target-path" && hasValue) { mirrorCfg.target_path = args[++i]; continue; }
        if (a == "--collector-url" && hasValue) { mirrorCfg.collector_url = args[++i]; continue; }
        if (a == "--no-mirror") { mirrorCfg.enabled = false; continue; }
        std::cerr << "unknown or incomplete option: " << a << std::endl;
        print_help();
        return 2;
    }
    Logger::instance().set_level(level);
    if (!logFile.empty() && !Logger::instance().set_file(logFile)) {
        std::cerr << "cannot open log file " << logFile << std::endl;
    }
    log_info("starting");
    ProxyServer server(port, cfg);
    auto obs = make_transaction_log_observer(server.dispatcher());
    auto mirror = make_mirror_addon(server.dispatcher(), mirrorCfg);
    server.attach_mirror(mirror);
    try {
        server.start();
    } catch (const eventtap::core::SetupError& e) {
        log_error(e.what());
        mirror->stop();
        return 1;
    }
    if (!exportCaFile.empty() || !exportCaDerFile.empty()) {
        auto ctx = server.tls_context();
        if (ctx && ctx->has_ca()) {
            if (!exportCaFile.empty()) {
                if (write_file(exportCaFile, ctx->export_ca_pem())) log_info(fmt::format("exported CA PEM to {}", exportCaFile));
                else log_error(fmt::format("cannot write {}", exportCaFile));
            }
            if (!exportCaDerFile.empty()) {
                if (write_file(exportCaDerFile, ctx->export_ca_der())) log_info(fmt::format("exported CA DER to {}", exportCaDerFile));
                else log_error(fmt::format("cannot write {}", exportCaDerFile));
            }
            log_info(fmt::format("CA fingerprint (SHA-256) {}", ctx->ca_fingerprint_sha256()));
        } else {
            log_warn("--export-ca ignored: MITM not enabled");
        }
    }
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    while (!stop_requested) std::this_thread::sleep_for(std::chrono::milliseconds(200));
    server.stop();
    if (!mirror->flush(std::chrono::milliseconds(mirrorCfg.forward_timeout_ms))) log_warn("mirror queue not drained before shutdown");
    mirror->stop();
    log_info(fmt::format("stopped (mirrored {}, failed {}, dropped {})", mirror->mirrored(), mirror->failed(), mirror->dropped()));
    return 0;
}
