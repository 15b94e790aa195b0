#pragma once
#include <cstdint>
#include <string>
#include <thread>
#include <atomic>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <unordered_map>
#include "eventtap/core/net/IoContext.h"
#include "eventtap/core/net/Socket.h"
#include "eventtap/core/http/MessageAssembler.h"
#include "eventtap/core/event/EventStore.h"
#include "eventtap/core/event/EventFilter.h"
#include "eventtap/core/server/ServerConfig.h"
#include "eventtap/core/server/BatchDecoder.h"
#include "eventtap/core/verify/EventSource.h"

namespace eventtap::core::server {
struct HttpReply {
    int status{200};
    std::string body;
    std::string content_type{"application/json"};
    std::string allow;  // Allow header for 405
};

// Local HTTP collector for mirrored analytics batches.
//   POST /event                        store a batch
//   GET  /health                       liveness and event count
//   GET  /events?name=&since_seq=      stored records as JSON
//   DELETE /events, POST|GET /reset    clear the store
class IngestionServer : public verify::EventSource {
public:
    IngestionServer(event::EventStore& store, ServerConfig cfg = {});
    ~IngestionServer() override;
    IngestionServer(const IngestionServer&) = delete;
    IngestionServer& operator=(const IngestionServer&) = delete;

    // Binds synchronously; throws SetupError when the port cannot be bound.
    void start();
    void stop();
    bool is_ready() const { return active.load(); }
    uint16_t port() const { return bound_port.load(); }
    std::string base_url() const;

    std::vector<event::EventRecord> query_all(const event::EventFilter& filter) const;
    std::vector<event::EventRecord> snapshot_since(uint64_t after_seq) const override;
    std::optional<uint64_t> last_seq() const override { return store.last_seq(); }
    std::size_t event_count() const { return store.size(); }
    std::size_t reset();

    // Exposed for tests: routes one complete request.
    HttpReply handle(const http::HttpMessage& request);

private:
    event::EventStore& store;
    ServerConfig config;
    BatchDecoder decoder;
    net::Listener listener;
    net::IoContext io;
    std::thread accept_thread;
    std::vector<std::thread> workers;
    std::atomic<bool> active { false };
    std::atomic<uint16_t> bound_port { 0 };
    std::atomic<uint64_t> batch_counter { 0 };
    std::mutex conn_mu;
    uint64_t next_conn_id { 1 };
    std::unordered_map<uint64_t, std::shared_ptr<net::Socket>> connections;

    void accept_loop();
    void serve(uint64_t id, std::shared_ptr<net::Socket> sock);
    void release(uint64_t id);
    HttpReply ingest(const http::HttpMessage& request);
    HttpReply list_events(const std::string& target) const;
};

// Polls GET <base_url>/health until it answers 200 or timeout elapses.
bool wait_until_ready(const std::string& base_url, std::chrono::milliseconds timeout);
// "HTTP/1.1 200 OK" with Content-Length framing.
std::string render_reply(const HttpReply& reply, bool keep_alive);
const char* reason_phrase(int status);
}
