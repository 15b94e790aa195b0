#pragma once
#include <string>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace eventtap::core::event {
// One analytics event as stored by the ingestion server. Immutable once stored.
struct EventRecord {
    uint64_t seq{0};  // 1-based insertion index assigned by EventStore
    std::string name;
    nlohmann::json payload;
    std::chrono::system_clock::time_point received_at;
    uint64_t source_batch_id{0};  // shared by every record of one POST /event
};

int64_t to_epoch_micros(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_epoch_micros(int64_t us);
// "2024-05-01T12:00:00.123456Z"
std::string format_iso8601(std::chrono::system_clock::time_point tp);

void to_json(nlohmann::json& j, const EventRecord& r);
void from_json(const nlohmann::json& j, EventRecord& r);
}
