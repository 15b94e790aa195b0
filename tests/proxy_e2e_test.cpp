#include "eventtap/core/proxy/ProxyServer.h"
#include "eventtap/core/proxy/MirrorAddon.h"
#include "eventtap/core/proxy/TransactionLogObserver.h"
#include "eventtap/core/server/IngestionServer.h"
#include "eventtap/core/net/UpstreamConnector.h"
#include "eventtap/core/http/HttpClient.h"
#include "eventtap/core/http/MessageAssembler.h"
#include <cassert>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace eventtap::core;
using namespace eventtap::core::proxy;
using namespace std::chrono;

namespace {
const std::string kOriginReply = "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 5\r\nX-Origin: yes\r\nConnection: close\r\n\r\nhello";

struct OriginHit {
    std::string target;
    std::vector<http::HttpHeader> headers;
    std::string body;
    bool chunked{false};
};

// Answers one request per connection with kOriginReply, then closes.
class Origin {
public:
    Origin() {
        bool ok = listener.open(0, "127.0.0.1");
        assert(ok);
        port = listener.bound_port();
        worker = std::thread([this]{ loop(); });
    }
    ~Origin() { running = false; worker.join(); listener.close(); }
    std::vector<OriginHit> hits() { std::lock_guard lock(mu); return seen; }
    uint16_t port{0};
private:
    net::Listener listener;
    std::thread worker;
    std::atomic<bool> running{true};
    std::mutex mu;
    std::vector<OriginHit> seen;

    void loop() {
        while (running.load()) {
            if (!listener.wait_acceptable(50)) continue;
            auto c = listener.accept();
            if (!c.valid()) continue;
            c.set_timeouts(2000, 2000);
            serve(c);
        }
    }
    void serve(net::Socket& c) {
        http::MessageAssembler a(http::MessageKind::Request);
        std::vector<char> buf(8192);
        while (true) {
            if (auto m = a.next()) {
                {
                    std::lock_guard lock(mu);
                    seen.push_back(OriginHit{ m->request_line.target, m->headers, m->body, m->chunked });
                }
                bool sent = c.send_all(kOriginReply);
                (void)sent;
                return;
            }
            if (a.failed()) return;
            auto r = c.recv_some(buf);
            if (!r) return;
            a.feed(std::string_view(buf.data(), static_cast<size_t>(*r)));
        }
    }
};

struct Recorder : TransactionObserver {
    std::mutex mu;
    std::vector<InterceptedRequest> requests;
    std::vector<Transaction> transactions;
    void on_request(const InterceptedRequest& r) override { std::lock_guard lock(mu); requests.push_back(r); }
    void on_transaction(const Transaction& t) override { std::lock_guard lock(mu); transactions.push_back(t); }
};

net::Socket connect_to(uint16_t port) {
    auto s = net::UpstreamConnector::connect("127.0.0.1", port, 2000, 3000);
    assert(s.has_value());
    return std::move(*s);
}

std::string read_to_end(net::Socket& s) {
    std::string out;
    std::vector<char> buf(4096);
    while (auto r = s.recv_some(buf)) out.append(buf.data(), static_cast<size_t>(*r));
    return out;
}

std::string exchange(uint16_t port, const std::string& request) {
    auto s = connect_to(port);
    bool sent = s.send_all(request);
    assert(sent);
    return read_to_end(s);
}

bool has_header(const std::vector<http::HttpHeader>& headers, const char* name) {
    return http::find_header(headers, name).has_value();
}
}

int main() {
    event::EventStore store;
    server::ServerConfig scfg; scfg.port = 0;
    server::IngestionServer collector(store, scfg);
    collector.start();
    Origin origin;
    std::string originAuthority = "127.0.0.1:" + std::to_string(origin.port);

    Config cfg; cfg.bindHost = "127.0.0.1"; cfg.idleTimeoutMs = 3000;
    ProxyServer proxy(0, cfg);
    auto logObserver = make_transaction_log_observer(proxy.dispatcher());
    MirrorConfig mcfg; mcfg.target_host = "127.0.0.1"; mcfg.target_path = "/batch"; mcfg.collector_url = collector.base_url() + "/event";
    auto mirror = make_mirror_addon(proxy.dispatcher(), mcfg);
    proxy.attach_mirror(mirror);
    auto recorder = std::make_shared<Recorder>();
    proxy.dispatcher().add(recorder);
    proxy.start();
    assert(proxy.running());
    assert(proxy.port() != 0);
    assert(!proxy.tls_context());

    // plain request: forwarded in origin-form, response relayed byte for byte, body mirrored
    std::string body = R"([{"name":"add_to_cart","sku":"A1"},{"name":"checkout"}])";
    std::string request = "POST http://" + originAuthority + "/batch?sdk=3 HTTP/1.1\r\nHost: " + originAuthority +
        "\r\nProxy-Connection: keep-alive\r\nContent-Type: application/json\r\nContent-Length: " + std::to_string(body.size()) +
        "\r\nConnection: close\r\n\r\n" + body;
    auto reply = exchange(proxy.port(), request);
    assert(reply == kOriginReply);
    auto hits = origin.hits();
    assert(hits.size() == 1);
    assert(hits[0].target == "/batch?sdk=3");
    assert(hits[0].body == body);
    assert(!has_header(hits[0].headers, "proxy-connection"));
    assert(http::find_header(hits[0].headers, "content-type") == std::string("application/json"));
    assert(mirror->flush(milliseconds(3000)));
    assert(store.size() == 2);
    assert(store.snapshot()[0].name == "add_to_cart");

    // other paths pass through without a copy
    auto other = exchange(proxy.port(), "GET http://" + originAuthority + "/config HTTP/1.1\r\nHost: " + originAuthority + "\r\nConnection: close\r\n\r\n");
    assert(other == kOriginReply);
    assert(mirror->flush(milliseconds(3000)));
    assert(store.size() == 2);
    assert(mirror->mirrored() == 1);

    // chunked upload: the origin gets the chunked framing, the collector the decoded body
    auto chunked = exchange(proxy.port(), "POST /batch HTTP/1.1\r\nHost: " + originAuthority +
        "\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\nf\r\n{\"name\":\"chunky\r\n2\r\n\"}\r\n0\r\n\r\n");
    assert(chunked == kOriginReply);
    hits = origin.hits();
    assert(hits.size() == 3);
    assert(hits[2].chunked && hits[2].body == "{\"name\":\"chunky\"}");
    assert(mirror->flush(milliseconds(3000)));
    assert(store.size() == 3);
    assert(store.snapshot()[2].name == "chunky");

    // CONNECT without interception is an opaque tunnel
    {
        auto s = connect_to(proxy.port());
        bool sent = s.send_all("CONNECT " + originAuthority + " HTTP/1.1\r\nHost: " + originAuthority + "\r\n\r\n");
        assert(sent);
        std::string head;
        std::vector<char> buf(1024);
        while (head.find("\r\n\r\n") == std::string::npos) {
            auto r = s.recv_some(buf);
            assert(r.has_value());
            head.append(buf.data(), static_cast<size_t>(*r));
        }
        assert(head.rfind("HTTP/1.1 200 Connection Established", 0) == 0);
        sent = s.send_all("POST /batch HTTP/1.1\r\nHost: inside\r\nContent-Length: 2\r\n\r\n[]");
        assert(sent);
        auto tunnelled = read_to_end(s);
        assert(tunnelled == kOriginReply);
        hits = origin.hits();
        assert(hits.size() == 4 && hits[3].target == "/batch");
        // tunnelled bytes are never parsed, so nothing was mirrored
        assert(mirror->flush(milliseconds(1000)));
        assert(mirror->mirrored() == 2);
    }

    // health endpoint served by the proxy itself
    auto health = http::HttpClient::get("http://127.0.0.1:" + std::to_string(proxy.port()) + "/__eventtap/health");
    assert(health && health->status == 200);
    auto hj = nlohmann::json::parse(health->body);
    assert(hj["status"] == "ok");
    assert(hj["port"] == proxy.port());
    assert(hj["mirrored"] == 2);
    assert(hj["failed"] == 0);

    // the CA is unavailable without interception
    auto ca = http::HttpClient::get("http://127.0.0.1:" + std::to_string(proxy.port()) + "/__eventtap/ca.pem");
    assert(ca && ca->status == 404);

    // unreachable origin
    net::Listener probe;
    bool opened = probe.open(0, "127.0.0.1");
    assert(opened);
    auto closedPort = probe.bound_port();
    probe.close();
    auto bad = exchange(proxy.port(), "GET http://127.0.0.1:" + std::to_string(closedPort) + "/x HTTP/1.1\r\nHost: 127.0.0.1:" + std::to_string(closedPort) + "\r\n\r\n");
    assert(bad.rfind("HTTP/1.1 502", 0) == 0);

    // malformed request line
    auto malformed = exchange(proxy.port(), "NONSENSE\r\n\r\n");
    assert(malformed.rfind("HTTP/1.1 400", 0) == 0);

    {
        std::lock_guard lock(recorder->mu);
        assert(recorder->requests.size() == 4);
        assert(recorder->requests[3].path == "/x");
        assert(recorder->requests[0].host == "127.0.0.1");
        assert(recorder->requests[0].port == origin.port);
        assert(recorder->requests[0].path == "/batch?sdk=3");
        assert(!recorder->requests[0].tls);
        bool sawTunnel = false, saw502 = false;
        for (auto& t : recorder->transactions) {
            if (t.mitmOutcome == "tunneled") sawTunnel = true;
            if (t.status == 502) saw502 = true;
        }
        assert(sawTunnel && saw502);
    }

    proxy.stop();
    assert(!proxy.running());
    assert(proxy.session_count() == 0);
    mirror->stop();
    collector.stop();
    return 0;
}
