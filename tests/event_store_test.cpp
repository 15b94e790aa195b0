#include "eventtap/core/event/EventStore.h"
#include <cassert>
#include <thread>
#include <vector>
#include <string>

using namespace eventtap::core::event;

static EventRecord make(const std::string& name, uint64_t batch){
    EventRecord r; r.name = name; r.payload = nlohmann::json{{"name", name}}; r.received_at = std::chrono::system_clock::now(); r.source_batch_id = batch;
    return r;
}

int main(){
    EventStore store;
    assert(store.size() == 0);
    assert(store.last_seq() == 0);

    auto last = store.append({ make("app_open", 1), make("screen_view", 1) });
    assert(last == 2);
    last = store.append({ make("purchase", 2) });
    assert(last == 3);

    auto all = store.snapshot();
    assert(all.size() == 3);
    assert(all[0].seq == 1 && all[0].name == "app_open");
    assert(all[1].seq == 2 && all[1].source_batch_id == 1);
    assert(all[2].seq == 3 && all[2].name == "purchase");

    auto tail = store.snapshot_since(1);
    assert(tail.size() == 2);
    assert(tail.front().seq == 2);
    assert(store.snapshot_since(3).empty());
    assert(store.snapshot_since(0).size() == 3);

    // seq keeps increasing across a clear
    assert(store.clear() == 3);
    assert(store.size() == 0);
    assert(store.clear() == 0);
    store.append({ make("after_reset", 3) });
    auto again = store.snapshot();
    assert(again.size() == 1 && again[0].seq == 4);

    // concurrent batches are never interleaved
    EventStore shared;
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&shared, t]{
            for (int i = 0; i < 50; ++i) shared.append({ make("a", t * 100 + i), make("b", t * 100 + i) });
        });
    }
    for (auto& w : writers) w.join();
    auto records = shared.snapshot();
    assert(records.size() == 400);
    for (size_t i = 0; i < records.size(); i += 2) {
        assert(records[i].seq == i + 1);
        assert(records[i].source_batch_id == records[i + 1].source_batch_id);
        assert(records[i].name == "a" && records[i + 1].name == "b");
    }

    // serialized form
    nlohmann::json j = again[0];
    assert(j["seq"] == 4);
    assert(j["name"] == "after_reset");
    assert(j["batch_id"] == 3);
    assert(j["received_at"].get<std::string>().back() == 'Z');
    auto back = j.get<EventRecord>();
    assert(back.seq == 4 && back.name == "after_reset" && back.payload == again[0].payload);
    assert(to_epoch_micros(back.received_at) == to_epoch_micros(again[0].received_at));
    assert(format_iso8601(from_epoch_micros(1500000)) == "1970-01-01T00:00:01.500000Z");
    return 0;
}
