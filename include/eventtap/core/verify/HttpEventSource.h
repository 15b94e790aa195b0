#pragma once
#include <string>
#include "eventtap/core/verify/EventSource.h"

namespace eventtap::core::verify {
// Polls a collector running in another process through GET /events.
// Transport or decode failures are logged and read as "nothing new yet".
class HttpEventSource : public EventSource {
public:
    explicit HttpEventSource(std::string base_url, int timeout_ms = 2000);
    std::vector<event::EventRecord> snapshot_since(uint64_t after_seq) const override;
    // From GET /health; empty when the collector is unreachable.
    std::optional<uint64_t> last_seq() const override;
    const std::string& base_url() const { return base; }
private:
    std::string base;
    int timeout_ms;
};
}
