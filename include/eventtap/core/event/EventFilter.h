#pragma once
#include "eventtap/core/event/EventRecord.h"
#include <string>
#include <optional>
#include <functional>
#include <vector>
#include <chrono>

namespace eventtap::core::event {
enum class NameMatch { exact, contains, starts_with, regex };

// Selection criteria for events. Unset fields do not constrain.
struct EventFilter {
    std::optional<std::string> name;
    NameMatch name_match{NameMatch::exact};
    // Half-open window [since, until) on received_at.
    std::optional<std::chrono::system_clock::time_point> since;
    std::optional<std::chrono::system_clock::time_point> until;
    std::optional<nlohmann::json> payload_subset;  // json_match::contains
    std::optional<nlohmann::json> payload_equals;
    std::function<bool(const EventRecord&)> where;

    static EventFilter by_name(std::string n, NameMatch mode = NameMatch::exact) {
        EventFilter f; f.name = std::move(n); f.name_match = mode; return f;
    }

    bool matches(const EventRecord& r) const;
    std::string describe() const;
};

// Matching records in insertion order.
std::vector<EventRecord> select(const std::vector<EventRecord>& records, const EventFilter& filter);
const char* to_string(NameMatch m);
}
