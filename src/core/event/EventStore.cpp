#include "eventtap/core/event/EventStore.h"
#include <algorithm>

namespace eventtap::core::event {
uint64_t EventStore::append(std::vector<EventRecord> batch) {
    std::lock_guard lock(mu);
    for (auto& r : batch) {
        r.seq = next_seq++;
        records.push_back(std::move(r));
    }
    return next_seq - 1;
}

std::vector<EventRecord> EventStore::snapshot() const {
    std::lock_guard lock(mu);
    return records;
}

std::vector<EventRecord> EventStore::snapshot_since(uint64_t after_seq) const {
    std::lock_guard lock(mu);
    // seq is strictly increasing, so the tail can be located by binary search
    auto it = std::upper_bound(records.begin(), records.end(), after_seq,
                               [](uint64_t s, const EventRecord& r){ return s < r.seq; });
    return std::vector<EventRecord>(it, records.end());
}

std::size_t EventStore::clear() {
    std::lock_guard lock(mu);
    auto n = records.size();
    records.clear();
    return n;
}

std::size_t EventStore::size() const {
    std::lock_guard lock(mu);
    return records.size();
}

uint64_t EventStore::last_seq() const {
    std::lock_guard lock(mu);
    return next_seq - 1;
}
}
