#include "eventtap/core/verify/HttpEventSource.h"
#include "eventtap/core/verify/EventVerifier.h"
#include "eventtap/core/server/IngestionServer.h"
#include "eventtap/core/http/HttpClient.h"
#include <cassert>
#include <string>
#include <thread>

using namespace eventtap::core;
using namespace std::chrono;

int main(){
    event::EventStore store;
    server::ServerConfig cfg; cfg.port = 0;
    server::IngestionServer collector(store, cfg);
    collector.start();

    verify::HttpEventSource source(collector.base_url() + "/", 2000);
    assert(source.base_url() == collector.base_url());
    assert(source.snapshot_since(0).empty());

    auto posted = http::HttpClient::post(collector.base_url() + "/event",
        R"([{"name":"signup","plan":"pro"},{"name":"login"},{"name":"logout"}])", "application/json");
    assert(posted && posted->status == 200);

    // records survive the trip through /events
    auto all = source.snapshot_since(0);
    assert(all.size() == 3);
    assert(all[0].seq == 1 && all[0].name == "signup");
    assert(all[0].payload["plan"] == "pro");
    assert(all[0].source_batch_id == all[2].source_batch_id);
    auto local = store.snapshot();
    assert(event::to_epoch_micros(all[1].received_at) == event::to_epoch_micros(local[1].received_at));
    auto tail = source.snapshot_since(2);
    assert(tail.size() == 1 && tail[0].name == "logout");

    // a verifier in another process would poll exactly like this
    verify::VerifierOptions opts; opts.poll_interval = milliseconds(50);
    verify::EventVerifier verifier(source, opts);
    std::thread late([&collector]{
        std::this_thread::sleep_for(milliseconds(150));
        auto r = http::HttpClient::post(collector.base_url() + "/event", R"({"name":"purchase","amount":9})", "application/json");
        assert(r && r->status == 200);
    });
    auto filter = event::EventFilter::by_name("purchase");
    filter.payload_subset = nlohmann::json{{"amount", 9}};
    auto hit = verifier.wait_for(filter, milliseconds(3000));
    late.join();
    assert(hit.seq == 4);
    assert(source.last_seq() == std::optional<uint64_t>(4));

    // an unreachable collector reads as empty
    collector.stop();
    assert(source.snapshot_since(0).empty());
    assert(!source.last_seq().has_value());
    assert(!verifier.try_wait_for(event::EventFilter::by_name("purchase"), milliseconds(120)).has_value());
    return 0;
}
