#pragma once
#include <string>
#include <string_view>
#include <memory>
#include <atomic>
#include <thread>
#include <optional>
#include <chrono>
#include <cstddef>
#include "eventtap/core/net/IoContext.h"
#include "eventtap/core/http/HttpClient.h"
#include "eventtap/core/proxy/Transaction.h"
#include "eventtap/core/proxy/TransactionDispatcher.h"

namespace eventtap::core::proxy {
// Which requests get mirrored and where copies go.
struct MirrorConfig {
    bool enabled { true };
    std::string target_host { "*" };       // exact host, or glob when it contains '*' or '?'
    std::string target_path { "/batch" };  // compared without query; empty matches every path
    std::string collector_url { "http://127.0.0.1:8000/event" };
    int forward_timeout_ms { 2000 };       // connect and read timeout for the collector POST
    std::size_t queue_capacity { 1024 };   // pending copies beyond this are dropped

    // EVENTTAP_MIRROR_ENABLED, EVENTTAP_TARGET_HOST, EVENTTAP_TARGET_PATH,
    // EVENTTAP_COLLECTOR_URL, EVENTTAP_MIRROR_TIMEOUT_MS, EVENTTAP_MIRROR_QUEUE
    static MirrorConfig from_env();
};

// Request observer that copies matching request bodies to the collector.
// on_request only enqueues; a dedicated worker thread does the POST, so the
// proxied request is never delayed by the collector.
class MirrorAddon : public TransactionObserver, public std::enable_shared_from_this<MirrorAddon> {
public:
    explicit MirrorAddon(MirrorConfig cfg);
    ~MirrorAddon() override;
    MirrorAddon(const MirrorAddon&) = delete;
    MirrorAddon& operator=(const MirrorAddon&) = delete;

    void start();
    // Pending copies are discarded.
    void stop();

    bool matches(std::string_view host, std::string_view path) const;
    void on_request(const InterceptedRequest& r) override;

    // Blocks until every queued copy has been attempted, or timeout. For tests and shutdown.
    bool flush(std::chrono::milliseconds timeout);

    uint64_t mirrored() const { return mirrored_count.load(); }
    uint64_t failed() const { return failed_count.load(); }
    uint64_t dropped() const { return dropped_count.load(); }
    bool active() const { return running.load(); }
    const MirrorConfig& config() const { return cfg; }

private:
    MirrorConfig cfg;
    std::optional<http::Url> collector;
    net::IoContext jobs;
    std::thread worker;
    std::atomic<bool> running { false };
    std::atomic<uint64_t> in_flight { 0 };
    std::atomic<uint64_t> mirrored_count { 0 };
    std::atomic<uint64_t> failed_count { 0 };
    std::atomic<uint64_t> dropped_count { 0 };

    void forward(const std::string& source, const std::string& body, const std::string& content_type);
};

// Creates, starts and registers an addon on the dispatcher.
std::shared_ptr<MirrorAddon> make_mirror_addon(TransactionDispatcher& d, MirrorConfig cfg);
}
