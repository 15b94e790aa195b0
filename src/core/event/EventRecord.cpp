#include "eventtap/core/event/EventRecord.h"
#include <fmt/format.h>
#include <ctime>

namespace eventtap::core::event {
int64_t to_epoch_micros(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_micros(int64_t us) {
    return std::chrono::system_clock::time_point(std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::microseconds(us)));
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    int64_t us = to_epoch_micros(tp);
    int64_t secs = us / 1000000;
    int64_t frac = us % 1000000;
    if (frac < 0) { frac += 1000000; --secs; }
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
}

void to_json(nlohmann::json& j, const EventRecord& r) {
    j = nlohmann::json{
        {"seq", r.seq},
        {"name", r.name},
        {"payload", r.payload},
        {"received_at_us", to_epoch_micros(r.received_at)},
        {"received_at", format_iso8601(r.received_at)},
        {"batch_id", r.source_batch_id},
    };
}

void from_json(const nlohmann::json& j, EventRecord& r) {
    r.seq = j.value("seq", uint64_t{0});
    r.name = j.value("name", std::string());
    r.payload = j.contains("payload") ? j.at("payload") : nlohmann::json();
    r.received_at = from_epoch_micros(j.value("received_at_us", int64_t{0}));
    r.source_batch_id = j.value("batch_id", uint64_t{0});
}
}
