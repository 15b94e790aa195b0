#include "eventtap/core/proxy/MirrorAddon.h"
#include "eventtap/core/proxy/MitmPolicy.h"
#include "eventtap/core/http/HostUtil.h"
#include "eventtap/core/util/Env.h"
#include "eventtap/core/util/Logger.h"
#include <fmt/format.h>

namespace eventtap::core::proxy {
using util::log_debug;
using util::log_error;
using util::log_info;
using util::log_warn;

MirrorConfig MirrorConfig::from_env() {
    MirrorConfig c;
    c.enabled = util::env_bool("EVENTTAP_MIRROR_ENABLED", c.enabled);
    c.target_host = util::env_string("EVENTTAP_TARGET_HOST", c.target_host);
    c.target_path = util::env_string("EVENTTAP_TARGET_PATH", c.target_path);
    c.collector_url = util::env_string("EVENTTAP_COLLECTOR_URL", c.collector_url);
    auto timeout = util::env_int("EVENTTAP_MIRROR_TIMEOUT_MS", c.forward_timeout_ms);
    if (timeout > 0 && timeout <= 600000) c.forward_timeout_ms = static_cast<int>(timeout);
    auto queue = util::env_int("EVENTTAP_MIRROR_QUEUE", static_cast<int64_t>(c.queue_capacity));
    if (queue > 0) c.queue_capacity = static_cast<std::size_t>(queue);
    return c;
}

MirrorAddon::MirrorAddon(MirrorConfig config) : cfg(std::move(config)) {}

MirrorAddon::~MirrorAddon() { stop(); }

void MirrorAddon::start() {
    if (running.load()) return;
    if (!cfg.enabled) {
        log_info("mirroring disabled");
        return;
    }
    collector = http::parse_url(cfg.collector_url);
    if (!collector || collector->scheme != "http") {
        log_error(fmt::format("mirroring disabled: collector url '{}' is not an http:// url", cfg.collector_url));
        collector.reset();
        return;
    }
    jobs.restart();
    running.store(true);
    worker = std::thread([this]{ jobs.run(); });
    log_info(fmt::format("mirroring host '{}' path '{}' to {}", cfg.target_host, cfg.target_path, cfg.collector_url));
}

void MirrorAddon::stop() {
    if (!running.exchange(false)) return;
    auto pending = jobs.pending();
    jobs.stop();
    if (worker.joinable()) worker.join();
    if (pending > 0) log_warn(fmt::format("mirror stopped with {} copies still queued", pending));
}

bool MirrorAddon::matches(std::string_view host, std::string_view path) const {
    std::string h(host);
    if (MitmPolicy::is_glob(cfg.target_host)) {
        if (!MitmPolicy::glob_match(cfg.target_host, h)) return false;
    } else if (!http::iequals(cfg.target_host, h)) {
        return false;
    }
    if (cfg.target_path.empty()) return true;
    std::string p(http::path_without_query(path));
    if (MitmPolicy::is_glob(cfg.target_path)) return MitmPolicy::glob_match(cfg.target_path, p);
    return p == cfg.target_path;
}

void MirrorAddon::on_request(const InterceptedRequest& r) {
    if (!running.load()) return;
    if (!matches(r.host, r.path)) return;
    std::string source = fmt::format("{} {}{}", r.method, r.host, r.path);
    in_flight.fetch_add(1);
    // the worker is joined in stop(), so queued jobs never outlive the addon
    bool queued = jobs.post([this, source, body = r.body, ct = r.content_type()]{
        forward(source, body, ct);
        in_flight.fetch_sub(1);
    }, cfg.queue_capacity);
    if (!queued) {
        in_flight.fetch_sub(1);
        dropped_count.fetch_add(1);
        log_warn(fmt::format("mirror queue full ({}), dropped copy of {}", cfg.queue_capacity, source));
        return;
    }
    log_debug(fmt::format("mirror queued {} ({} bytes)", source, r.body.size()));
}

void MirrorAddon::forward(const std::string& source, const std::string& body, const std::string& content_type) {
    auto resp = http::HttpClient::request(*collector, "POST", body, content_type.empty() ? std::string("application/json") : content_type, cfg.forward_timeout_ms);
    if (!resp) {
        failed_count.fetch_add(1);
        log_warn(fmt::format("mirror of {} failed: collector {} unreachable or timed out", source, cfg.collector_url));
        return;
    }
    if (!resp->ok()) {
        failed_count.fetch_add(1);
        log_warn(fmt::format("mirror of {} failed: collector answered {} {}", source, resp->status, resp->body));
        return;
    }
    mirrored_count.fetch_add(1);
    log_debug(fmt::format("mirrored {} -> {}", source, resp->body));
}

bool MirrorAddon::flush(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (in_flight.load() > 0) {
        if (!running.load() || std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

std::shared_ptr<MirrorAddon> make_mirror_addon(TransactionDispatcher& d, MirrorConfig cfg) {
    auto a = std::make_shared<MirrorAddon>(std::move(cfg));
    a->start();
    d.add(a);
    return a;
}
}
