#pragma once
#include <cstdint>
#include <string>
#include <thread>
#include <atomic>
#include <list>
#include <mutex>
#include <memory>
#include "eventtap/core/net/Socket.h"
#include "eventtap/core/proxy/TransactionDispatcher.h"
#include "eventtap/core/proxy/Config.h"
#include "eventtap/core/proxy/MirrorAddon.h"
#include "eventtap/core/tls/TlsContext.h"
#include "eventtap/core/proxy/MitmPolicy.h"

namespace eventtap::core::proxy {
class ClientSession;

class ProxyServer {
public:
    explicit ProxyServer(uint16_t listen_port, Config cfg = {});
    ~ProxyServer();
    // Binds synchronously; throws SetupError when the port cannot be bound.
    void start();
    // Closes the listener, aborts live sessions and joins their threads.
    void stop();
    bool running() const { return active.load(); }
    uint16_t port() const { return bound_port.load(); }
    TransactionDispatcher& dispatcher();
    std::shared_ptr<tls::TlsContext> tls_context() const { return tls_ctx; }
    MitmPolicy& mitm_policy() { return mitmPolicy; }
    // The addon whose counters /__eventtap/health reports.
    void attach_mirror(std::shared_ptr<MirrorAddon> addon) { mirror = std::move(addon); }
    std::string health_json() const;
    std::size_t session_count();
private:
    struct SessionEntry {
        std::shared_ptr<ClientSession> session;
        std::thread thread;
    };
    uint16_t requested_port;
    Config config;
    std::thread accept_thread;
    std::atomic<bool> active { false };
    std::atomic<uint16_t> bound_port { 0 };
    net::Listener listener;
    TransactionDispatcher tx_dispatcher;
    std::shared_ptr<tls::TlsContext> tls_ctx; // created if TLS MITM enabled
    MitmPolicy mitmPolicy; // runtime toggle & filters
    std::shared_ptr<MirrorAddon> mirror;
    std::mutex sessions_mu;
    std::list<SessionEntry> sessions;
    void run_loop();
    void reap_finished();
};
}
