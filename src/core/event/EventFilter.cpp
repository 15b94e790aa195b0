#include "eventtap/core/event/EventFilter.h"
#include "eventtap/core/event/JsonMatch.h"
#include <fmt/format.h>
#include <regex>

namespace eventtap::core::event {
namespace {
bool name_matches(const std::string& actual, const std::string& wanted, NameMatch mode) {
    switch (mode) {
        case NameMatch::exact: return actual == wanted;
        case NameMatch::contains: return actual.find(wanted) != std::string::npos;
        case NameMatch::starts_with: return actual.rfind(wanted, 0) == 0;
        case NameMatch::regex: {
            try {
                return std::regex_search(actual, std::regex(wanted));
            } catch (const std::regex_error&) {
                return false;  // an invalid pattern never matches
            }
        }
    }
    return false;
}
}

const char* to_string(NameMatch m) {
    switch (m) {
        case NameMatch::exact: return "exact";
        case NameMatch::contains: return "contains";
        case NameMatch::starts_with: return "starts_with";
        case NameMatch::regex: return "regex";
    }
    return "?";
}

bool EventFilter::matches(const EventRecord& r) const {
    if (name && !name_matches(r.name, *name, name_match)) return false;
    if (since && r.received_at < *since) return false;
    if (until && !(r.received_at < *until)) return false;
    if (payload_equals && r.payload != *payload_equals) return false;
    if (payload_subset && !json_match::contains(r.payload, *payload_subset)) return false;
    if (where && !where(r)) return false;
    return true;
}

std::string EventFilter::describe() const {
    std::string out;
    auto add = [&](const std::string& part) { if (!out.empty()) out += ", "; out += part; };
    if (name) add(fmt::format("name {} '{}'", to_string(name_match), *name));
    if (since) add(fmt::format("since {}", format_iso8601(*since)));
    if (until) add(fmt::format("until {}", format_iso8601(*until)));
    if (payload_subset) add(fmt::format("payload contains {}", payload_subset->dump()));
    if (payload_equals) add(fmt::format("payload equals {}", payload_equals->dump()));
    if (where) add("custom predicate");
    return out.empty() ? std::string("any event") : out;
}

std::vector<EventRecord> select(const std::vector<EventRecord>& records, const EventFilter& filter) {
    std::vector<EventRecord> out;
    for (const auto& r : records) {
        if (filter.matches(r)) out.push_back(r);
    }
    return out;
}
}
