#pragma once
#include "eventtap/core/event/EventRecord.h"
#include <vector>
#include <optional>
#include <cstdint>

namespace eventtap::core::verify {
// Read-only view of an event store, polled by EventVerifier.
class EventSource {
public:
    virtual ~EventSource() = default;
    // Records with seq > after_seq in insertion order. 0 returns everything.
    virtual std::vector<event::EventRecord> snapshot_since(uint64_t after_seq) const = 0;
    // Highest seq the store has assigned, when the source can tell.
    // A value below a reader's cursor means the store was replaced (collector restart).
    virtual std::optional<uint64_t> last_seq() const { return std::nullopt; }
};
}
