#include "eventtap/core/proxy/ClientSession.h"
#include "eventtap/core/proxy/Transaction.h"
#include "eventtap/core/proxy/MitmPolicy.h"
#include "eventtap/core/http/HostUtil.h"
#include "eventtap/core/net/UpstreamConnector.h"
#include "eventtap/core/util/Logger.h"
#include <fmt/format.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <string>
#include <string_view>
#include <atomic>
#include <cstdint>
#include <algorithm>
#include <cctype>

namespace eventtap::core::proxy {
using util::log_debug;
using util::log_info;
using util::log_warn;

static std::atomic<uint64_t> nextId{1};

namespace {
constexpr const char* kEstablished = "HTTP/1.1 200 Connection Established\r\nProxy-Agent: eventtap\r\n\r\n";

std::string simple_response(int status, const char* reason, std::string_view body, const std::string& content_type = "text/plain; charset=utf-8", const std::string& extra = {}) {
    return fmt::format("HTTP/1.1 {} {}\r\nContent-Type: {}\r\nContent-Length: {}\r\n{}Connection: close\r\n\r\n{}", status, reason, content_type, body.size(), extra, body);
}

std::string openssl_errors() {
    std::string out;
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out;
}

bool ssl_write_all(SSL* ssl, const char* data, int len) {
    while (len > 0) {
        int n = SSL_write(ssl, data, len);
        if (n <= 0) return false;
        data += n; len -= n;
    }
    return true;
}
}

std::string rewrite_request_head(const http::HttpMessage& req, const std::string& origin_path, const std::string& host_header) {
    std::string head = fmt::format("{} {} {}\r\n", req.request_line.method, origin_path, req.request_line.version);
    bool hasHost = false;
    for (auto& h : req.headers) {
        if (http::iequals(h.name, "proxy-connection")) continue;
        if (http::iequals(h.name, "host")) hasHost = true;
        head += h.name;
        head += ": ";
        head += h.value;
        head += "\r\n";
    }
    if (!hasHost) head.insert(head.find("\r\n") + 2, fmt::format("Host: {}\r\n", host_header));
    head += "\r\n";
    return head;
}

ClientSession::ClientSession(std::shared_ptr<net::Socket> socket, TransactionDispatcher& dispatcher, const Config& cfg, std::shared_ptr<tls::TlsContext> tlsCtx)
    : sock(std::move(socket)), dispatcher_ref(dispatcher), config(cfg), tls_ctx(std::move(tlsCtx)),
      start_time(std::chrono::steady_clock::now()), session_id(nextId.fetch_add(1, std::memory_order_relaxed)) {
    buffer.resize(16384);
}

void ClientSession::start() {
    process();
    drop_upstream();
    {
        std::lock_guard lock(io_mu);
        sock->close();
    }
    done.store(true);
}

void ClientSession::abort() {
    aborted.store(true);
    std::lock_guard lock(io_mu);
    sock->shutdown();
    if (upstream) upstream->shutdown();
}

bool ClientSession::send_client(std::string_view data) {
    if (!sock->send_all(data)) return false;
    bytesOut += data.size();
    return true;
}

void ClientSession::publish(const std::string& requestLine, const std::string& host, int status, const std::string& outcome, uint64_t in, uint64_t out) {
    Transaction t{};
    t.id = nextId.fetch_add(1, std::memory_order_relaxed);
    t.startTime = start_time;
    t.wallTime = std::chrono::system_clock::now();
    t.requestLine = requestLine;
    t.host = host;
    t.bytesIn = in;
    t.bytesOut = out;
    t.status = status;
    t.tlsMitmIntercepted = outcome == "intercepted";
    t.mitmOutcome = outcome;
    dispatcher_ref.publish(t);
}

void ClientSession::process() {
    http::MessageAssembler requests(http::MessageKind::Request, config.maxBodyBytes);
    bool open = true;
    while (open && !aborted.load()) {
        auto msg = requests.next();
        if (!msg) {
            if (requests.failed()) {
                bool tooLarge = requests.error() == http::MessageAssembler::Error::TooLarge;
                log_warn(fmt::format("session {} rejected request: {}", session_id, tooLarge ? "too large" : "malformed"));
                if (tooLarge) send_client(simple_response(413, "Payload Too Large", "request too large\n"));
                else send_client(simple_response(400, "Bad Request", "malformed request\n"));
                return;
            }
            auto r = sock->recv_some(buffer);
            if (!r) return;
            bytesIn += static_cast<uint64_t>(*r);
            requests.feed(std::string_view(buffer.data(), static_cast<size_t>(*r)));
            continue;
        }
        if (msg->request_line.method == "CONNECT") {
            handle_connect(*msg);
            return;
        }
        open = forward_plain(*msg);
    }
}

bool ClientSession::serve_internal(const http::HttpMessage& req, const std::string& host, const std::string& path) {
    std::string bare(http::path_without_query(path));
    bool caHost = host == "ca" || host == "ssl" || host == "cert";
    if (!caHost && bare.rfind("/__eventtap/", 0) != 0) return false;

    auto send_ca = [&](bool der) {
        std::string content = tls_ctx ? (der ? tls_ctx->export_ca_der() : tls_ctx->export_ca_pem()) : std::string();
        if (content.empty()) {
            send_client(simple_response(404, "Not Found", "TLS interception is not enabled\n"));
            return 404;
        }
        auto type = der ? "application/x-x509-ca-cert" : "application/x-pem-file";
        auto name = der ? "eventtap_root_ca.der" : "eventtap_root_ca.pem";
        send_client(simple_response(200, "OK", content, type, fmt::format("Content-Disposition: attachment; filename=\"{}\"\r\n", name)));
        return 200;
    };

    int status;
    if (req.request_line.method != "GET") {
        status = 405;
        send_client(simple_response(405, "Method Not Allowed", "GET only\n", "text/plain; charset=utf-8", "Allow: GET\r\n"));
    } else if (caHost) {
        status = send_ca(bare.find("der") != std::string::npos);
    } else if (bare == "/__eventtap/health") {
        std::string body = status_provider ? status_provider() : std::string("{\"status\":\"ok\"}");
        send_client(simple_response(200, "OK", body, "application/json"));
        status = 200;
    } else if (bare == "/__eventtap/ca.pem") {
        status = send_ca(false);
    } else if (bare == "/__eventtap/ca.der") {
        status = send_ca(true);
    } else {
        status = 404;
        send_client(simple_response(404, "Not Found", "unknown endpoint\n"));
    }
    publish(fmt::format("{} {}", req.request_line.method, req.request_line.target), host, status, "internal", bytesIn, bytesOut);
    return true;
}

bool ClientSession::forward_plain(const http::HttpMessage& req) {
    const auto& method = req.request_line.method;
    auto target = http::extract_host_target(http::HttpRequest{ req.request_line, req.headers });
    std::string host = target ? target->host : std::string();
    std::string path = target ? target->path : req.request_line.target;
    if (serve_internal(req, host, path)) return false;
    std::string requestLine = fmt::format("{} {}", method, req.request_line.target);
    if (!target) {
        send_client(simple_response(400, "Bad Request", "missing host\n"));
        publish(requestLine, host, 400, {}, bytesIn, bytesOut);
        return false;
    }

    InterceptedRequest ir;
    ir.session_id = session_id;
    ir.method = method;
    ir.host = target->host;
    ir.port = target->port;
    ir.path = path;
    ir.headers = req.headers;
    ir.body = req.body;
    ir.received_at = std::chrono::system_clock::now();
    dispatcher_ref.publish_request(ir);

    std::string hostHeader = target->port == 80 ? target->host : fmt::format("{}:{}", target->host, target->port);
    std::string head = rewrite_request_head(req, path, hostHeader);
    uint64_t in0 = bytesIn, out0 = bytesOut;

    // a cached keep-alive upstream may have been closed by the origin; retry once on a fresh one
    for (int attempt = 0; attempt < 2; ++attempt) {
        bool reused = false;
        auto up = connect_upstream(target->host, target->port, reused);
        if (!up) {
            log_warn(fmt::format("session {} upstream connect failed {}:{}", session_id, target->host, target->port));
            send_client(simple_response(502, "Bad Gateway", "upstream connection failed\n"));
            publish(requestLine, target->host, 502, {}, bytesIn - in0, bytesOut - out0);
            return false;
        }
        if (!up->send_all(head) || (!req.raw_body.empty() && !up->send_all(req.raw_body))) {
            drop_upstream();
            if (reused) continue;
            send_client(simple_response(502, "Bad Gateway", "upstream write failed\n"));
            publish(requestLine, target->host, 502, {}, bytesIn - in0, bytesOut - out0);
            return false;
        }

        http::MessageAssembler responses(http::MessageKind::Response, config.maxBodyBytes);
        responses.expect_response_to(method);
        std::vector<char> ubuf(16384);
        bool relayed = false, complete = false, untilClose = false, respKeep = false;
        int status = 0;
        while (!complete && !aborted.load()) {
            auto r = up->recv_some(ubuf);
            if (!r) {
                if (!relayed && reused) break; // stale connection, retry
                responses.finish();
                while (auto m = responses.next()) {
                    if (m->status_line.code >= 200) { status = m->status_line.code; complete = true; }
                }
                untilClose = true;
                break;
            }
            std::string_view chunk(ubuf.data(), static_cast<size_t>(*r));
            if (!send_client(chunk)) { drop_upstream(); return false; }
            relayed = true;
            if (untilClose) continue;
            responses.feed(chunk);
            while (auto m = responses.next()) {
                int code = m->status_line.code;
                if (code == 101) {
                    // protocol switch: the rest of the connection is opaque
                    std::shared_ptr<net::Socket> origin;
                    {
                        std::lock_guard lock(io_mu);
                        origin = upstream;
                    }
                    uint64_t in = 0, out = 0;
                    if (origin) relay_sockets(*sock, *origin, in, out);
                    drop_upstream();
                    publish(requestLine, target->host, 101, {}, bytesIn - in0 + in, bytesOut - out0 + out);
                    return false;
                }
                if (code >= 200) { status = code; respKeep = m->keep_alive(); complete = true; }
            }
            if (responses.failed()) {
                log_debug(fmt::format("session {} response framing lost, relaying until close", session_id));
                untilClose = true;
            }
        }
        if (!relayed && reused && !aborted.load()) { drop_upstream(); continue; }
        if (!relayed) {
            drop_upstream();
            send_client(simple_response(502, "Bad Gateway", "upstream closed without response\n"));
            publish(requestLine, target->host, 502, {}, bytesIn - in0, bytesOut - out0);
            return false;
        }
        publish(requestLine, target->host, status, {}, bytesIn - in0, bytesOut - out0);
        bool keep = complete && !untilClose && respKeep && req.keep_alive();
        if (!keep) drop_upstream();
        return keep && !untilClose;
    }
    return false;
}

std::shared_ptr<net::Socket> ClientSession::connect_upstream(const std::string& host, uint16_t port, bool& reused) {
    std::string key = fmt::format("{}:{}", host, port);
    {
        std::lock_guard lock(io_mu);
        if (upstream && upstream->valid() && upstream_key == key) { reused = true; return upstream; }
    }
    drop_upstream();
    reused = false;
    auto s = net::UpstreamConnector::connect(host, port, config.connectTimeoutMs, config.idleTimeoutMs);
    if (!s) return nullptr;
    auto ptr = std::make_shared<net::Socket>(std::move(*s));
    set_upstream(ptr, key);
    return ptr;
}

void ClientSession::set_upstream(std::shared_ptr<net::Socket> s, std::string key) {
    std::lock_guard lock(io_mu);
    upstream = std::move(s);
    upstream_key = std::move(key);
    if (aborted.load() && upstream) upstream->shutdown();
}

void ClientSession::drop_upstream() {
    std::lock_guard lock(io_mu);
    if (upstream) upstream->close();
    upstream.reset();
    upstream_key.clear();
}

void ClientSession::relay_sockets(net::Socket& client, net::Socket& origin, uint64_t& in, uint64_t& out) {
    std::vector<char> cbuf(16384), ubuf(16384);
    auto lastActivity = std::chrono::steady_clock::now();
    while (!aborted.load()) {
        fd_set readfds;
        FD_ZERO(&readfds);
        int cfd = client.native();
        int ufd = origin.native();
        if (cfd < 0 || ufd < 0) break;
        FD_SET(cfd, &readfds);
        FD_SET(ufd, &readfds);
        timeval tv{1, 0};
        int ret = select(std::max(cfd, ufd) + 1, &readfds, nullptr, nullptr, &tv);
        if (ret < 0) break;
        if (ret == 0) {
            if (std::chrono::steady_clock::now() - lastActivity > std::chrono::milliseconds(config.idleTimeoutMs)) {
                log_debug(fmt::format("session {} tunnel idle timeout", session_id));
                break;
            }
            continue;
        }
        lastActivity = std::chrono::steady_clock::now();
        if (FD_ISSET(cfd, &readfds)) {
            auto r = client.recv_some(cbuf);
            if (!r || !origin.send_all(std::string_view(cbuf.data(), static_cast<size_t>(*r)))) break;
            in += static_cast<uint64_t>(*r);
        }
        if (FD_ISSET(ufd, &readfds)) {
            auto r = origin.recv_some(ubuf);
            if (!r || !client.send_all(std::string_view(ubuf.data(), static_cast<size_t>(*r)))) break;
            out += static_cast<uint64_t>(*r);
        }
    }
}

void ClientSession::handle_connect(const http::HttpMessage& req) {
    std::string target = req.request_line.target;
    std::string requestLine = fmt::format("CONNECT {}", target);
    std::string host = target;
    uint16_t port = 443;
    auto colonPos = target.find_last_of(':');
    auto closeBracket = target.find(']');
    if (colonPos != std::string::npos && (closeBracket == std::string::npos || colonPos > closeBracket)) {
        host = target.substr(0, colonPos);
        unsigned long p = 0;
        bool digits = colonPos + 1 < target.size();
        for (size_t i = colonPos + 1; i < target.size(); ++i) {
            char c = target[i];
            if (c < '0' || c > '9') { digits = false; break; }
            p = p * 10 + static_cast<unsigned long>(c - '0');
            if (p > 65535) { digits = false; break; }
        }
        if (!digits || p == 0) host.clear();
        else port = static_cast<uint16_t>(p);
    }
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') host = host.substr(1, host.size() - 2);
    std::transform(host.begin(), host.end(), host.begin(), [](unsigned char c){ return char(std::tolower(c)); });
    if (host.empty()) {
        send_client(simple_response(400, "Bad Request", "bad CONNECT target\n"));
        publish(requestLine, host, 400, {}, bytesIn, bytesOut);
        return;
    }

    bool shouldIntercept = policy && tls_ctx && tls_ctx->has_ca() && policy->should_intercept(host);
    if (shouldIntercept && policy->is_pinned(host)) {
        log_debug(fmt::format("session {} MITM skipped for pinned host {}", session_id, host));
        tunnel(host, port, requestLine);
        return;
    }
    if (shouldIntercept) handle_ssl_mitm(host, port, requestLine);
    else tunnel(host, port, requestLine);
}

void ClientSession::tunnel(const std::string& host, uint16_t port, const std::string& requestLine) {
    bool pinned = policy && policy->is_enabled() && policy->is_pinned(host);
    auto s = net::UpstreamConnector::connect(host, port, config.connectTimeoutMs);
    if (!s) {
        log_warn(fmt::format("session {} tunnel connect failed {}:{}", session_id, host, port));
        send_client(simple_response(502, "Bad Gateway", "upstream connection failed\n"));
        publish(requestLine, host, 502, "tunneled", bytesIn, bytesOut);
        return;
    }
    auto origin = std::make_shared<net::Socket>(std::move(*s));
    set_upstream(origin, {});
    if (!send_client(kEstablished)) return;
    uint64_t in = 0, out = 0;
    relay_sockets(*sock, *origin, in, out);
    bytesIn += in;
    bytesOut += out;
    drop_upstream();
    log_debug(fmt::format("session {} tunnel {}:{} closed in {} out {}", session_id, host, port, in, out));
    publish(requestLine, host, 200, pinned ? "pinned" : "tunneled", bytesIn, bytesOut);
}

void ClientSession::handle_ssl_mitm(const std::string& host, uint16_t port, const std::string& requestLine) {
    auto s = net::UpstreamConnector::connect(host, port, config.connectTimeoutMs, config.idleTimeoutMs);
    if (!s) {
        log_warn(fmt::format("session {} MITM upstream connect failed {}:{}", session_id, host, port));
        send_client(simple_response(502, "Bad Gateway", "upstream connection failed\n"));
        publish(requestLine, host, 502, "upstream-fail", bytesIn, bytesOut);
        return;
    }
    auto origin = std::make_shared<net::Socket>(std::move(*s));
    set_upstream(origin, {});

    SSL* upstreamSsl = SSL_new(tls_ctx->client_ssl_ctx());
    if (!upstreamSsl) {
        send_client(simple_response(502, "Bad Gateway", "TLS setup failed\n"));
        drop_upstream();
        return;
    }
    SSL_set_fd(upstreamSsl, origin->native());
    SSL_set_tlsext_host_name(upstreamSsl, host.c_str());
    if (SSL_connect(upstreamSsl) != 1) {
        log_warn(fmt::format("session {} MITM upstream handshake failed for {}: {}", session_id, host, openssl_errors()));
        SSL_free(upstreamSsl);
        drop_upstream();
        send_client(simple_response(502, "Bad Gateway", "upstream TLS handshake failed\n"));
        publish(requestLine, host, 502, "upstream-handshake-fail", bytesIn, bytesOut);
        return;
    }

    SSL_CTX* serverCtx = tls_ctx->make_server_ctx(host);
    SSL* clientSsl = serverCtx ? SSL_new(serverCtx) : nullptr;
    if (!clientSsl) {
        log_warn(fmt::format("session {} MITM certificate for {} unavailable", session_id, host));
        if (serverCtx) SSL_CTX_free(serverCtx);
        SSL_shutdown(upstreamSsl);
        SSL_free(upstreamSsl);
        drop_upstream();
        send_client(simple_response(503, "Service Unavailable", "certificate generation failed\n"));
        publish(requestLine, host, 503, "cert-fail", bytesIn, bytesOut);
        return;
    }

    auto cleanup = [&]{
        SSL_free(clientSsl);
        SSL_CTX_free(serverCtx);
        SSL_free(upstreamSsl);
        drop_upstream();
    };

    if (!send_client(kEstablished)) { cleanup(); return; }
    sock->set_timeouts(10000, 10000);
    SSL_set_fd(clientSsl, sock->native());
    if (SSL_accept(clientSsl) != 1) {
        // the client refused our leaf: certificate pinning or an untrusted root
        if (policy) policy->mark_pinned(host);
        log_info(fmt::format("session {} MITM handshake with client failed for {}, tunnelling this host for {} minutes: {}",
                             session_id, host, MitmPolicy::kPinTtl.count(), openssl_errors()));
        cleanup();
        publish(requestLine, host, 200, "handshake-fail", bytesIn, bytesOut);
        return;
    }
    sock->set_timeouts(config.idleTimeoutMs, config.idleTimeoutMs);
    log_debug(fmt::format("session {} MITM established for {} ({})", session_id, host, SSL_get_version(clientSsl)));

    http::MessageAssembler requests(http::MessageKind::Request, config.maxBodyBytes);
    std::vector<char> clientBuf(16384), upstreamBuf(16384);
    uint64_t in = 0, out = 0, seen = 0;
    auto lastActivity = std::chrono::steady_clock::now();
    int cfd = sock->native();
    int ufd = origin->native();
    while (!aborted.load()) {
        bool clientReady = SSL_pending(clientSsl) > 0;
        bool upstreamReady = SSL_pending(upstreamSsl) > 0;
        if (!clientReady && !upstreamReady) {
            fd_set readfds;
            FD_ZERO(&readfds);
            FD_SET(cfd, &readfds);
            FD_SET(ufd, &readfds);
            timeval tv{1, 0};
            int ret = select(std::max(cfd, ufd) + 1, &readfds, nullptr, nullptr, &tv);
            if (ret < 0) break;
            if (ret == 0) {
                if (std::chrono::steady_clock::now() - lastActivity > std::chrono::milliseconds(config.idleTimeoutMs)) break;
                continue;
            }
            clientReady = FD_ISSET(cfd, &readfds);
            upstreamReady = FD_ISSET(ufd, &readfds);
        }
        lastActivity = std::chrono::steady_clock::now();

        if (clientReady) {
            int n = SSL_read(clientSsl, clientBuf.data(), static_cast<int>(clientBuf.size()));
            if (n <= 0) {
                int err = SSL_get_error(clientSsl, n);
                if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) break;
            } else {
                in += static_cast<uint64_t>(n);
                std::string_view chunk(clientBuf.data(), static_cast<size_t>(n));
                if (!requests.failed()) {
                    requests.feed(chunk);
                    while (auto m = requests.next()) {
                        InterceptedRequest ir;
                        ir.session_id = session_id;
                        ir.method = m->request_line.method;
                        ir.host = host;
                        ir.port = port;
                        ir.path = m->request_line.target;
                        if (auto t = http::extract_host_target(http::HttpRequest{ m->request_line, m->headers }, port)) ir.path = t->path;
                        ir.headers = std::move(m->headers);
                        ir.body = std::move(m->body);
                        ir.tls = true;
                        ir.received_at = std::chrono::system_clock::now();
                        ++seen;
                        dispatcher_ref.publish_request(ir);
                    }
                    if (requests.failed()) log_debug(fmt::format("session {} decrypted stream is not HTTP/1.x, relaying only", session_id));
                }
                if (!ssl_write_all(upstreamSsl, clientBuf.data(), n)) break;
            }
        }
        if (upstreamReady) {
            int n = SSL_read(upstreamSsl, upstreamBuf.data(), static_cast<int>(upstreamBuf.size()));
            if (n <= 0) {
                int err = SSL_get_error(upstreamSsl, n);
                if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) break;
            } else {
                out += static_cast<uint64_t>(n);
                if (!ssl_write_all(clientSsl, upstreamBuf.data(), n)) break;
            }
        }
    }

    SSL_shutdown(clientSsl);
    SSL_shutdown(upstreamSsl);
    ERR_clear_error();
    cleanup();
    log_debug(fmt::format("session {} MITM {} closed after {} requests", session_id, host, seen));
    publish(requestLine, host, 200, "intercepted", bytesIn + in, bytesOut + out);
}
}
