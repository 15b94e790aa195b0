#include "eventtap/core/server/IngestionServer.h"
#include "eventtap/core/Error.h"
#include "eventtap/core/http/HostUtil.h"
#include "eventtap/core/http/HttpClient.h"
#include "eventtap/core/util/Logger.h"
#include <fmt/format.h>
#include <cstdlib>
#include <cerrno>

namespace eventtap::core::server {
using nlohmann::json;
using util::log_debug;
using util::log_info;
using util::log_warn;

namespace {
HttpReply json_reply(int status, const json& body) { return HttpReply{ status, body.dump(), "application/json", {} }; }
HttpReply error_reply(int status, const std::string& message) { return json_reply(status, json{{"error", message}}); }
HttpReply method_not_allowed(const char* allow) {
    HttpReply r = error_reply(405, "method not allowed");
    r.allow = allow;
    return r;
}
}

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
    }
    return "Unknown";
}

std::string render_reply(const HttpReply& reply, bool keep_alive) {
    std::string out = fmt::format("HTTP/1.1 {} {}\r\nContent-Type: {}\r\nContent-Length: {}\r\n",
                                  reply.status, reason_phrase(reply.status), reply.content_type, reply.body.size());
    if (!reply.allow.empty()) out += fmt::format("Allow: {}\r\n", reply.allow);
    out += keep_alive ? "Connection: keep-alive\r\n\r\n" : "Connection: close\r\n\r\n";
    out += reply.body;
    return out;
}

IngestionServer::IngestionServer(event::EventStore& s, ServerConfig cfg)
    : store(s), config(std::move(cfg)),
      decoder(DecoderOptions{ config.name_field, config.name_fallback_path, config.envelope_field }) {}

IngestionServer::~IngestionServer() { stop(); }

void IngestionServer::start() {
    if (active.load()) return;
    if (!listener.open(config.port, config.host)) {
        throw SetupError(fmt::format("ingestion server cannot bind {}:{}", config.host, config.port));
    }
    bound_port.store(listener.bound_port());
    io.restart();
    active.store(true);
    unsigned n = config.worker_threads == 0 ? 1 : config.worker_threads;
    for (unsigned i = 0; i < n; ++i) workers.emplace_back([this]{ io.run(); });
    accept_thread = std::thread(&IngestionServer::accept_loop, this);
    log_info(fmt::format("ingestion server listening on {}", base_url()));
}

void IngestionServer::stop() {
    if (!active.exchange(false)) return;
    if (accept_thread.joinable()) accept_thread.join();
    listener.close();
    {
        std::lock_guard lock(conn_mu);
        for (auto& [id, sock] : connections) sock->shutdown();
    }
    io.stop();
    for (auto& w : workers) if (w.joinable()) w.join();
    workers.clear();
    {
        std::lock_guard lock(conn_mu);
        connections.clear();
    }
    log_info("ingestion server stopped");
}

std::string IngestionServer::base_url() const {
    return fmt::format("http://{}:{}", config.host == "0.0.0.0" ? std::string("127.0.0.1") : config.host, port());
}

std::vector<event::EventRecord> IngestionServer::query_all(const event::EventFilter& filter) const {
    return event::select(store.snapshot(), filter);
}

std::vector<event::EventRecord> IngestionServer::snapshot_since(uint64_t after_seq) const {
    return store.snapshot_since(after_seq);
}

std::size_t IngestionServer::reset() {
    auto n = store.clear();
    log_info(fmt::format("event store cleared ({} events)", n));
    return n;
}

void IngestionServer::accept_loop() {
    while (active.load()) {
        if (!listener.wait_acceptable(100)) continue;
        auto client = listener.accept();
        if (!client.valid()) continue;
        client.set_timeouts(config.io_timeout_ms, config.io_timeout_ms);
        auto sock = std::make_shared<net::Socket>(std::move(client));
        uint64_t id;
        {
            std::lock_guard lock(conn_mu);
            id = next_conn_id++;
            connections.emplace(id, sock);
        }
        if (!io.post([this, id, sock]{ serve(id, sock); })) {
            release(id);
        }
    }
}

void IngestionServer::release(uint64_t id) {
    std::shared_ptr<net::Socket> sock;
    {
        std::lock_guard lock(conn_mu);
        auto it = connections.find(id);
        if (it == connections.end()) return;
        sock = std::move(it->second);
        connections.erase(it);
    }
    sock->close();
}

void IngestionServer::serve(uint64_t id, std::shared_ptr<net::Socket> sock) {
    http::MessageAssembler assembler(http::MessageKind::Request, config.max_body_bytes);
    std::vector<char> buffer(16384);
    bool open = true;
    while (open && active.load()) {
        if (auto msg = assembler.next()) {
            HttpReply reply = handle(*msg);
            bool keep = msg->keep_alive() && active.load();
            if (!sock->send_all(render_reply(reply, keep))) break;
            open = keep;
            continue;
        }
        if (assembler.failed()) {
            auto status = assembler.error() == http::MessageAssembler::Error::TooLarge ? 413 : 400;
            auto message = status == 413 ? fmt::format("body exceeds {} bytes", config.max_body_bytes) : std::string("malformed HTTP request");
            log_warn(fmt::format("ingestion request rejected: {}", message));
            if (!sock->send_all(render_reply(error_reply(status, message), false))) log_debug("client gone before the error reply");
            break;
        }
        if (!assembler.in_progress()) {
            // idle keep-alive connection: give the worker back if other connections are waiting
            bool readable = false;
            for (int waited = 0; waited < config.keep_alive_ms && active.load(); waited += 100) {
                if (sock->wait_readable(100)) { readable = true; break; }
                if (io.pending() > 0) break;
            }
            if (!readable) break;
        }
        auto r = sock->recv_some(buffer);
        if (!r) break;
        assembler.feed(std::string_view(buffer.data(), static_cast<size_t>(*r)));
    }
    release(id);
}

HttpReply IngestionServer::handle(const http::HttpMessage& request) {
    const auto& method = request.request_line.method;
    const auto& target = request.request_line.target;
    std::string path(http::path_without_query(target));
    log_debug(fmt::format("ingestion {} {}", method, target));

    if (path == "/event") {
        if (method != "POST") return method_not_allowed("POST");
        return ingest(request);
    }
    if (path == "/health") {
        if (method != "GET") return method_not_allowed("GET");
        return json_reply(200, json{{"status", "ok"}, {"events", store.size()}, {"last_seq", store.last_seq()}});
    }
    if (path == "/events") {
        if (method == "GET") return list_events(target);
        if (method == "DELETE") return json_reply(200, json{{"cleared", reset()}});
        return method_not_allowed("GET, DELETE");
    }
    if (path == "/reset") {
        if (method != "POST" && method != "GET") return method_not_allowed("GET, POST");
        return json_reply(200, json{{"cleared", reset()}});
    }
    return error_reply(404, "not found");
}

HttpReply IngestionServer::ingest(const http::HttpMessage& request) {
    if (request.body.size() > config.max_body_bytes) {
        return error_reply(413, fmt::format("body exceeds {} bytes", config.max_body_bytes));
    }
    auto result = decoder.decode(request.body);
    uint64_t batch = batch_counter.fetch_add(1) + 1;
    for (const auto& issue : result.issues) {
        log_warn(fmt::format("batch {} element {} skipped: {}", batch, issue.index, issue.reason));
    }
    if (result.rejected()) {
        log_warn(fmt::format("batch {} rejected: {}", batch, result.error));
        return error_reply(400, result.error);
    }
    auto now = std::chrono::system_clock::now();
    std::vector<event::EventRecord> records;
    records.reserve(result.events.size());
    for (auto& e : result.events) {
        event::EventRecord r;
        r.name = std::move(e.name);
        r.payload = std::move(e.payload);
        r.received_at = now;
        r.source_batch_id = batch;
        records.push_back(std::move(r));
    }
    auto stored = records.size();
    if (!records.empty()) store.append(std::move(records));
    log_info(fmt::format("batch {} stored {} of {} events", batch, stored, result.elements));
    return json_reply(200, json{{"stored", stored}});
}

HttpReply IngestionServer::list_events(const std::string& target) const {
    uint64_t since = 0;
    if (auto s = http::query_param(target, "since_seq")) {
        if (s->empty()) return error_reply(400, "since_seq must be a non-negative integer");
        char* end = nullptr;
        errno = 0;
        auto v = std::strtoull(s->c_str(), &end, 10);
        if (errno != 0 || *end != '\0' || s->front() == '-') return error_reply(400, "since_seq must be a non-negative integer");
        since = v;
    }
    auto name = http::query_param(target, "name");
    json out = json::array();
    for (const auto& r : store.snapshot_since(since)) {
        if (name && r.name != *name) continue;
        out.push_back(r);
    }
    return json_reply(200, out);
}

bool wait_until_ready(const std::string& base_url, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto resp = http::HttpClient::get(base_url + "/health", 500);
        if (resp && resp->status == 200) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}
}
