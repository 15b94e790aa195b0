#include "eventtap/core/proxy/MirrorAddon.h"
#include "eventtap/core/proxy/TransactionDispatcher.h"
#include "eventtap/core/server/IngestionServer.h"
#include "eventtap/core/net/Socket.h"
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <string>

using namespace eventtap::core;
using namespace eventtap::core::proxy;
using namespace std::chrono;

static InterceptedRequest batch_request(const std::string& host, const std::string& path, const std::string& body){
    InterceptedRequest r;
    r.method = "POST"; r.host = host; r.path = path; r.body = body;
    r.headers = { {"Host", host}, {"Content-Type", "application/json"} };
    r.received_at = system_clock::now();
    return r;
}

static uint16_t closed_port(){
    net::Listener l;
    bool ok = l.open(0, "127.0.0.1");
    assert(ok);
    auto p = l.bound_port();
    l.close();
    return p;
}

int main(){
    // matching rules
    {
        MirrorConfig cfg; cfg.target_host = "a.example.com"; cfg.target_path = "/batch"; cfg.enabled = false;
        MirrorAddon addon(cfg);
        assert(addon.matches("a.example.com", "/batch"));
        assert(addon.matches("A.Example.COM", "/batch?sdk=1"));
        assert(!addon.matches("b.example.com", "/batch"));
        assert(!addon.matches("a.example.com", "/batch/extra"));
        assert(!addon.matches("a.example.com", "/Batch"));

        MirrorConfig globs; globs.target_host = "*.example.com"; globs.target_path = "/v?/*"; globs.enabled = false;
        MirrorAddon g(globs);
        assert(g.matches("api.example.com", "/v1/collect"));
        assert(!g.matches("example.com", "/v1/collect"));
        assert(!g.matches("api.example.com", "/v10/collect"));

        MirrorConfig any; any.target_host = "*"; any.target_path = ""; any.enabled = false;
        MirrorAddon all(any);
        assert(all.matches("whatever.test", "/anything"));
    }

    // scenario: only the configured host is mirrored
    {
        event::EventStore store;
        server::ServerConfig scfg; scfg.port = 0;
        server::IngestionServer collector(store, scfg);
        collector.start();

        TransactionDispatcher d;
        MirrorConfig cfg; cfg.target_host = "a.example.com"; cfg.target_path = "/batch"; cfg.collector_url = collector.base_url() + "/event";
        auto addon = make_mirror_addon(d, cfg);
        assert(addon->active());

        d.publish_request(batch_request("b.example.com", "/batch", R"([{"name":"ignored"}])"));
        assert(addon->flush(milliseconds(2000)));
        assert(store.size() == 0);
        assert(addon->mirrored() == 0);

        d.publish_request(batch_request("a.example.com", "/batch?v=2", R"([{"name":"open"},{"name":"close"}])"));
        assert(addon->flush(milliseconds(3000)));
        assert(addon->mirrored() == 1);
        assert(store.size() == 2);
        auto records = store.snapshot();
        assert(records[0].name == "open" && records[1].name == "close");
        addon->stop();
        assert(!addon->active());
        collector.stop();
    }

    // unreachable collector: on_request returns at once, failure is only counted
    {
        TransactionDispatcher d;
        MirrorConfig cfg; cfg.target_path = "/batch"; cfg.collector_url = "http://127.0.0.1:" + std::to_string(closed_port()) + "/event";
        cfg.forward_timeout_ms = 500;
        auto addon = make_mirror_addon(d, cfg);
        auto before = steady_clock::now();
        d.publish_request(batch_request("app.test", "/batch", "[]"));
        assert(steady_clock::now() - before < milliseconds(100));
        assert(addon->flush(milliseconds(3000)));
        assert(addon->failed() == 1);
        assert(addon->mirrored() == 0);
    }

    // a collector that never answers fills the queue; extra copies are dropped
    {
        net::Listener silent;
        bool ok = silent.open(0, "127.0.0.1");
        assert(ok);
        TransactionDispatcher d;
        MirrorConfig cfg; cfg.target_path = "/batch"; cfg.queue_capacity = 1; cfg.forward_timeout_ms = 300;
        cfg.collector_url = "http://127.0.0.1:" + std::to_string(silent.bound_port()) + "/event";
        auto addon = make_mirror_addon(d, cfg);
        for (int i = 0; i < 3; ++i) d.publish_request(batch_request("app.test", "/batch", "[]"));
        assert(addon->dropped() >= 1);
        assert(addon->flush(milliseconds(5000)));
        assert(addon->failed() + addon->dropped() == 3);
    }

    // inactive configurations
    {
        MirrorConfig off; off.enabled = false;
        MirrorAddon disabled(off);
        disabled.start();
        assert(!disabled.active());
        disabled.on_request(batch_request("a", "/batch", "[]"));
        assert(disabled.dropped() == 0 && disabled.failed() == 0);

        MirrorConfig tls; tls.collector_url = "https://collector.test/event";
        MirrorAddon https(tls);
        https.start();
        assert(!https.active());
    }

    // environment configuration
    {
        setenv("EVENTTAP_TARGET_HOST", "events.example.org", 1);
        setenv("EVENTTAP_TARGET_PATH", "/v2/batch", 1);
        setenv("EVENTTAP_COLLECTOR_URL", "http://127.0.0.1:9999/event", 1);
        setenv("EVENTTAP_MIRROR_ENABLED", "false", 1);
        setenv("EVENTTAP_MIRROR_QUEUE", "8", 1);
        auto cfg = MirrorConfig::from_env();
        assert(cfg.target_host == "events.example.org");
        assert(cfg.target_path == "/v2/batch");
        assert(cfg.collector_url == "http://127.0.0.1:9999/event");
        assert(!cfg.enabled);
        assert(cfg.queue_capacity == 8);
        assert(cfg.forward_timeout_ms == 2000);
        unsetenv("EVENTTAP_TARGET_HOST");
        unsetenv("EVENTTAP_TARGET_PATH");
        unsetenv("EVENTTAP_COLLECTOR_URL");
        unsetenv("EVENTTAP_MIRROR_ENABLED");
        unsetenv("EVENTTAP_MIRROR_QUEUE");
        auto defaults = MirrorConfig::from_env();
        assert(defaults.enabled && defaults.target_host == "*" && defaults.target_path == "/batch");
    }
    return 0;
}
