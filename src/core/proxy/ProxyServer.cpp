#include "eventtap/core/proxy/ProxyServer.h"
#include "eventtap/core/proxy/ClientSession.h"
#include "eventtap/core/Error.h"
#include "eventtap/core/util/Logger.h"
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <csignal>
#include <cstdlib>
#include <filesystem>

namespace eventtap::core::proxy {
using eventtap::core::util::log_info;
using eventtap::core::util::log_warn;
using eventtap::core::net::Socket;

namespace {
struct PlatformInit {
    PlatformInit() {
        // peers vanish mid-write; SSL_write does not take MSG_NOSIGNAL
        std::signal(SIGPIPE, SIG_IGN);
    }
};
}

TransactionDispatcher& ProxyServer::dispatcher() { return tx_dispatcher; }

ProxyServer::ProxyServer(uint16_t listen_port, Config cfg) : requested_port(listen_port), config(std::move(cfg)) {
    if (config.enableTlsMitm) {
        std::string autoCert, autoKey;
        if (config.caCertPath.empty() || config.caKeyPath.empty()) {
            const char* home = std::getenv("HOME");
            std::string base = home ? std::string(home) : std::string(".");
            base += "/.eventtap";
            std::error_code ec; std::filesystem::create_directories(base, ec);
            autoCert = base + "/root_ca.pem";
            autoKey  = base + "/root_ca_key.pem";
        }
        tls::CertConfig cc{};
        cc.caCertPath = config.caCertPath.empty() ? autoCert : config.caCertPath;
        cc.caKeyPath  = config.caKeyPath.empty() ? autoKey : config.caKeyPath;
        cc.generateIfMissing = config.generateCaIfMissing || config.regenerateCa;
        if (config.regenerateCa) {
            std::error_code ec;
            std::filesystem::remove(cc.caCertPath, ec);
            std::filesystem::remove(cc.caKeyPath, ec);
            log_info(fmt::format("regenerating root CA at {}", cc.caCertPath));
        }
        tls_ctx = tls::TlsContext::create(cc);
        if (!tls_ctx->has_ca()) log_warn("TLS interception requested but no root CA is available; CONNECT will be tunnelled");
    }
    mitmPolicy.set_enabled(config.enableTlsMitm);
    mitmPolicy.set_lists(MitmPolicy::split_list(config.mitmAllowList), MitmPolicy::split_list(config.mitmDenyList));
}

ProxyServer::~ProxyServer() { stop(); }

void ProxyServer::start() {
    if (active.load()) return;
    static PlatformInit platform;
    if (!listener.open(requested_port, config.bindHost)) {
        throw SetupError(fmt::format("proxy cannot listen on {}:{}", config.bindHost, requested_port));
    }
    bound_port.store(listener.bound_port());
    active.store(true);
    accept_thread = std::thread(&ProxyServer::run_loop, this);
    log_info(fmt::format("proxy listening on {}:{} (mitm {})", config.bindHost, port(), mitmPolicy.is_enabled() ? "on" : "off"));
}

void ProxyServer::stop() {
    if (!active.exchange(false)) return;
    if (accept_thread.joinable()) accept_thread.join();
    listener.close();
    std::list<SessionEntry> remaining;
    {
        std::lock_guard lock(sessions_mu);
        remaining.swap(sessions);
    }
    for (auto& e : remaining) e.session->abort();
    for (auto& e : remaining) if (e.thread.joinable()) e.thread.join();
    log_info("proxy stopped");
}

std::string ProxyServer::health_json() const {
    nlohmann::json j{
        {"status", "ok"},
        {"port", port()},
        {"mitm", mitmPolicy.is_enabled()},
        {"mirroring", mirror && mirror->active()},
        {"mirrored", mirror ? mirror->mirrored() : 0},
        {"failed", mirror ? mirror->failed() : 0},
        {"dropped", mirror ? mirror->dropped() : 0},
    };
    return j.dump();
}

std::size_t ProxyServer::session_count() {
    std::lock_guard lock(sessions_mu);
    return sessions.size();
}

void ProxyServer::reap_finished() {
    std::list<SessionEntry> finished;
    {
        std::lock_guard lock(sessions_mu);
        for (auto it = sessions.begin(); it != sessions.end();) {
            if (it->session->finished()) {
                auto next = std::next(it);
                finished.splice(finished.end(), sessions, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& e : finished) if (e.thread.joinable()) e.thread.join();
}

void ProxyServer::run_loop() {
    while (active.load()) {
        reap_finished();
        if (!listener.wait_acceptable(100)) continue;
        auto client = listener.accept();
        if (!client.valid()) continue;
        client.set_timeouts(config.idleTimeoutMs, config.idleTimeoutMs);
        auto socket_ptr = std::make_shared<Socket>(std::move(client));
        auto session = std::make_shared<ClientSession>(socket_ptr, tx_dispatcher, config, tls_ctx);
        session->set_mitm_policy(&mitmPolicy);
        session->set_status_provider([this]{ return health_json(); });
        std::lock_guard lock(sessions_mu);
        sessions.push_back(SessionEntry{ session, std::thread([session]{ session->start(); }) });
    }
}
}
