#include "eventtap/core/proxy/ProxyServer.h"
#include "eventtap/core/proxy/MirrorAddon.h"
#include "eventtap/core/server/IngestionServer.h"
#include "eventtap/core/net/UpstreamConnector.h"
#include "eventtap/core/http/HttpClient.h"
#include "eventtap/core/http/MessageAssembler.h"
#include <cassert>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

using namespace eventtap::core;
using namespace eventtap::core::proxy;
using namespace std::chrono;
namespace fs = std::filesystem;

namespace {
const std::string kReply = "HTTP/1.1 201 Created\r\nContent-Length: 7\r\nConnection: close\r\n\r\ncreated";

// HTTPS origin presenting a leaf from its own, unrelated CA.
class TlsOrigin {
public:
    explicit TlsOrigin(const std::shared_ptr<tls::TlsContext>& ca) : serverCtx(ca->make_server_ctx("127.0.0.1")) {
        assert(serverCtx);
        bool ok = listener.open(0, "127.0.0.1");
        assert(ok);
        port = listener.bound_port();
        worker = std::thread([this]{ loop(); });
    }
    ~TlsOrigin() { running = false; worker.join(); listener.close(); SSL_CTX_free(serverCtx); }
    std::vector<std::string> targets() { std::lock_guard lock(mu); return seen; }
    uint16_t port{0};
private:
    SSL_CTX* serverCtx;
    net::Listener listener;
    std::thread worker;
    std::atomic<bool> running{true};
    std::mutex mu;
    std::vector<std::string> seen;

    void loop() {
        while (running.load()) {
            if (!listener.wait_acceptable(50)) continue;
            auto c = listener.accept();
            if (!c.valid()) continue;
            c.set_timeouts(3000, 3000);
            SSL* ssl = SSL_new(serverCtx);
            SSL_set_fd(ssl, c.native());
            if (SSL_accept(ssl) == 1) {
                serve(ssl);
                SSL_shutdown(ssl);
            }
            SSL_free(ssl);
            ERR_clear_error();
        }
    }
    void serve(SSL* ssl) {
        http::MessageAssembler a(http::MessageKind::Request);
        char buf[4096];
        while (true) {
            if (auto m = a.next()) {
                { std::lock_guard lock(mu); seen.push_back(m->request_line.target); }
                SSL_write(ssl, kReply.data(), static_cast<int>(kReply.size()));
                return;
            }
            if (a.failed()) return;
            int n = SSL_read(ssl, buf, sizeof(buf));
            if (n <= 0) return;
            a.feed(std::string_view(buf, static_cast<size_t>(n)));
        }
    }
};

struct Recorder : TransactionObserver {
    std::mutex mu;
    std::vector<InterceptedRequest> requests;
    std::vector<std::string> outcomes;
    void on_request(const InterceptedRequest& r) override { std::lock_guard lock(mu); requests.push_back(r); }
    void on_transaction(const Transaction& t) override { std::lock_guard lock(mu); outcomes.push_back(t.mitmOutcome); }
};

// Opens a CONNECT tunnel through the proxy and returns the socket right after the 200 head.
net::Socket open_tunnel(uint16_t proxyPort, uint16_t originPort) {
    auto s = net::UpstreamConnector::connect("127.0.0.1", proxyPort, 2000, 5000);
    assert(s.has_value());
    std::string authority = "127.0.0.1:" + std::to_string(originPort);
    bool sent = s->send_all("CONNECT " + authority + " HTTP/1.1\r\nHost: " + authority + "\r\n\r\n");
    assert(sent);
    // one byte at a time so no TLS record is consumed along with the head
    std::string head;
    std::vector<char> one(1);
    while (head.size() < 4 || head.compare(head.size() - 4, 4, "\r\n\r\n") != 0) {
        auto r = s->recv_some(one);
        assert(r.has_value());
        head.push_back(one[0]);
    }
    assert(head.rfind("HTTP/1.1 200 Connection Established", 0) == 0);
    return std::move(*s);
}

// Client context trusting only the given root.
SSL_CTX* client_trusting(const std::string& caPem) {
    SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
    assert(ctx);
    SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
    BIO* bio = BIO_new_mem_buf(caPem.data(), static_cast<int>(caPem.size()));
    X509* root = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    assert(root);
    X509_STORE_add_cert(SSL_CTX_get_cert_store(ctx), root);
    X509_free(root);
    return ctx;
}

// Handshakes over the tunnel, sends request and reads until close. Empty when the handshake fails.
std::optional<std::string> https_exchange(net::Socket& s, SSL_CTX* ctx, const std::string& request) {
    SSL* ssl = SSL_new(ctx);
    SSL_set_fd(ssl, s.native());
    X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), "127.0.0.1");
    if (SSL_connect(ssl) != 1) {
        SSL_free(ssl);
        ERR_clear_error();
        return std::nullopt;
    }
    int w = SSL_write(ssl, request.data(), static_cast<int>(request.size()));
    assert(w == static_cast<int>(request.size()));
    std::string out;
    char buf[4096];
    int n;
    while ((n = SSL_read(ssl, buf, sizeof(buf))) > 0) out.append(buf, static_cast<size_t>(n));
    SSL_free(ssl);
    ERR_clear_error();
    return out;
}
}

int main() {
    auto dir = fs::temp_directory_path() / ("eventtap_mitm_test_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    auto originCa = tls::TlsContext::create({ (dir / "origin_ca.pem").string(), (dir / "origin_ca_key.pem").string(), true });
    assert(originCa->has_ca());
    TlsOrigin origin(originCa);

    event::EventStore store;
    server::ServerConfig scfg; scfg.port = 0;
    server::IngestionServer collector(store, scfg);
    collector.start();

    Config cfg;
    cfg.bindHost = "127.0.0.1";
    cfg.idleTimeoutMs = 3000;
    cfg.enableTlsMitm = true;
    cfg.caCertPath = (dir / "proxy_ca.pem").string();
    cfg.caKeyPath = (dir / "proxy_ca_key.pem").string();
    ProxyServer proxy(0, cfg);
    MirrorConfig mcfg; mcfg.target_host = "127.0.0.1"; mcfg.target_path = "/batch"; mcfg.collector_url = collector.base_url() + "/event";
    auto mirror = make_mirror_addon(proxy.dispatcher(), mcfg);
    proxy.attach_mirror(mirror);
    auto recorder = std::make_shared<Recorder>();
    proxy.dispatcher().add(recorder);
    proxy.start();
    auto proxyCa = proxy.tls_context();
    assert(proxyCa && proxyCa->has_ca());
    assert(fs::exists(cfg.caCertPath));

    // root certificate download
    std::string proxyUrl = "http://127.0.0.1:" + std::to_string(proxy.port());
    auto pem = http::HttpClient::get(proxyUrl + "/__eventtap/ca.pem");
    assert(pem && pem->status == 200);
    assert(pem->body == proxyCa->export_ca_pem());
    auto der = http::HttpClient::get(proxyUrl + "/__eventtap/ca.der");
    assert(der && der->status == 200 && der->body == proxyCa->export_ca_der());
    auto health = http::HttpClient::get(proxyUrl + "/__eventtap/health");
    assert(health && nlohmann::json::parse(health->body)["mitm"] == true);

    // a client trusting the proxy root sees the decrypted exchange mirrored
    SSL_CTX* trustsProxy = client_trusting(proxyCa->export_ca_pem());
    {
        auto s = open_tunnel(proxy.port(), origin.port);
        std::string body = R"([{"name":"secure_checkout","total":12.5}])";
        auto reply = https_exchange(s, trustsProxy,
            "POST /batch?k=1 HTTP/1.1\r\nHost: 127.0.0.1\r\nContent-Type: application/json\r\nContent-Length: " +
            std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body);
        assert(reply.has_value());
        assert(*reply == kReply);
    }
    auto targets = origin.targets();
    assert(targets.size() == 1 && targets[0] == "/batch?k=1");
    assert(mirror->flush(milliseconds(3000)));
    auto secure = store.snapshot();
    assert(secure.size() == 1);
    assert(secure[0].name == "secure_checkout");
    assert(secure[0].payload["total"] == 12.5);
    {
        std::lock_guard lock(recorder->mu);
        assert(recorder->requests.size() == 1);
        assert(recorder->requests[0].tls);
        assert(recorder->requests[0].host == "127.0.0.1");
        assert(recorder->requests[0].path == "/batch?k=1");
    }

    // a client that abandons the handshake gets the host pinned
    assert(!proxy.mitm_policy().is_pinned("127.0.0.1"));
    {
        auto s = open_tunnel(proxy.port(), origin.port);
        s.close();
    }
    auto deadline = steady_clock::now() + seconds(5);
    while (!proxy.mitm_policy().is_pinned("127.0.0.1") && steady_clock::now() < deadline) std::this_thread::sleep_for(milliseconds(20));
    assert(proxy.mitm_policy().is_pinned("127.0.0.1"));

    // pinned hosts are tunnelled: the client now sees the origin's own certificate
    SSL_CTX* trustsOrigin = client_trusting(originCa->export_ca_pem());
    {
        auto s = open_tunnel(proxy.port(), origin.port);
        auto reply = https_exchange(s, trustsOrigin, "GET /after-pin HTTP/1.1\r\nHost: 127.0.0.1\r\nConnection: close\r\n\r\n");
        assert(reply.has_value());
        assert(*reply == kReply);
    }
    targets = origin.targets();
    assert(targets.size() == 2 && targets[1] == "/after-pin");
    {
        std::lock_guard lock(recorder->mu);
        assert(recorder->requests.size() == 1);
    }

    // hosts on the deny list are never intercepted
    proxy.mitm_policy().set_lists({}, {"127.0.0.*"});
    assert(!proxy.mitm_policy().should_intercept("127.0.0.1"));

    proxy.stop();
    {
        std::lock_guard lock(recorder->mu);
        bool intercepted = false, failed = false, pinned = false;
        for (auto& o : recorder->outcomes) {
            if (o == "intercepted") intercepted = true;
            if (o == "handshake-fail") failed = true;
            if (o == "pinned") pinned = true;
        }
        assert(intercepted && failed && pinned);
    }
    SSL_CTX_free(trustsProxy);
    SSL_CTX_free(trustsOrigin);
    mirror->stop();
    collector.stop();
    fs::remove_all(dir);
    return 0;
}
