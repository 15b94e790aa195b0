#pragma once
#include "eventtap/core/event/EventRecord.h"
#include <vector>
#include <mutex>
#include <cstddef>

namespace eventtap::core::event {
// Append-only, insertion-ordered record store shared by the ingestion server and its readers.
class EventStore {
public:
    // Assigns seq to every record and appends the batch atomically. Returns the last seq assigned.
    uint64_t append(std::vector<EventRecord> records);
    std::vector<EventRecord> snapshot() const;
    // Records with seq > after_seq, in insertion order.
    std::vector<EventRecord> snapshot_since(uint64_t after_seq) const;
    // Returns how many records were removed. Sequence numbers keep increasing across clears.
    std::size_t clear();
    std::size_t size() const;
    uint64_t last_seq() const;
private:
    mutable std::mutex mu;
    std::vector<EventRecord> records;
    uint64_t next_seq{1};
};
}
