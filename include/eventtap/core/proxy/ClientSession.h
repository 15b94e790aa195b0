#pragma once
#include <memory>
#include <vector>
#include <string>
#include <chrono>
#include <mutex>
#include <atomic>
#include <functional>
#include <optional>
#include "eventtap/core/net/Socket.h"
#include "eventtap/core/http/HttpParser.h"
#include "eventtap/core/http/MessageAssembler.h"
#include "eventtap/core/proxy/TransactionDispatcher.h"
#include "eventtap/core/proxy/Config.h"
#include "eventtap/core/tls/TlsContext.h"

namespace eventtap::core::proxy {
class MitmPolicy;

// One client connection. Serves keep-alive HTTP requests, CONNECT tunnels and
// intercepted TLS until either side closes. Runs on its own thread and never throws.
class ClientSession : public std::enable_shared_from_this<ClientSession> {
public:
    ClientSession(std::shared_ptr<net::Socket> socket, TransactionDispatcher& dispatcher, const Config& cfg, std::shared_ptr<tls::TlsContext> tlsCtx = {});
    void set_mitm_policy(MitmPolicy* p){ policy = p; }
    // JSON body served at /__eventtap/health.
    void set_status_provider(std::function<std::string()> f){ status_provider = std::move(f); }
    void start();
    // Unblocks the session from another thread; it then winds down on its own.
    void abort();
    bool finished() const { return done.load(); }
    uint64_t id() const { return session_id; }

private:
    std::shared_ptr<net::Socket> sock;
    TransactionDispatcher& dispatcher_ref;
    Config config;
    std::shared_ptr<tls::TlsContext> tls_ctx;
    MitmPolicy* policy { nullptr }; // non-owning
    std::function<std::string()> status_provider;
    std::vector<char> buffer;
    std::chrono::steady_clock::time_point start_time;
    uint64_t session_id;
    std::atomic<bool> done { false };
    std::atomic<bool> aborted { false };

    std::mutex io_mu;  // guards socket teardown against abort()
    std::shared_ptr<net::Socket> upstream;
    std::string upstream_key;  // host:port of the cached upstream connection

    uint64_t bytesIn { 0 };
    uint64_t bytesOut { 0 };

    void process();
    bool send_client(std::string_view data);
    // false when the client connection must close afterwards
    bool forward_plain(const http::HttpMessage& req);
    bool serve_internal(const http::HttpMessage& req, const std::string& host, const std::string& path);
    void handle_connect(const http::HttpMessage& req);
    void tunnel(const std::string& host, uint16_t port, const std::string& requestLine);
    void handle_ssl_mitm(const std::string& host, uint16_t port, const std::string& requestLine);
    std::shared_ptr<net::Socket> connect_upstream(const std::string& host, uint16_t port, bool& reused);
    void set_upstream(std::shared_ptr<net::Socket> s, std::string key);
    void relay_sockets(net::Socket& client, net::Socket& origin, uint64_t& in, uint64_t& out);
    void drop_upstream();
    void publish(const std::string& requestLine, const std::string& host, int status, const std::string& outcome, uint64_t in, uint64_t out);
};

// Origin-form request head without hop-by-hop proxy headers.
std::string rewrite_request_head(const http::HttpMessage& req, const std::string& origin_path, const std::string& host_header);
}
