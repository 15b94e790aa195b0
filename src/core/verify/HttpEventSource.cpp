#include "eventtap/core/verify/HttpEventSource.h"
#include "eventtap/core/http/HttpClient.h"
#include "eventtap/core/util/Logger.h"
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace eventtap::core::verify {
using eventtap::core::util::log_warn;

HttpEventSource::HttpEventSource(std::string base_url, int timeout) : base(std::move(base_url)), timeout_ms(timeout) {
    while (!base.empty() && base.back() == '/') base.pop_back();
}

std::vector<event::EventRecord> HttpEventSource::snapshot_since(uint64_t after_seq) const {
    auto url = fmt::format("{}/events?since_seq={}", base, after_seq);
    auto resp = http::HttpClient::get(url, timeout_ms);
    if (!resp) {
        log_warn(fmt::format("event poll {} failed: collector unreachable", url));
        return {};
    }
    if (!resp->ok()) {
        log_warn(fmt::format("event poll {} failed: HTTP {}", url, resp->status));
        return {};
    }
    try {
        auto j = nlohmann::json::parse(resp->body);
        if (!j.is_array()) {
            log_warn(fmt::format("event poll {} returned {} instead of an array", url, j.type_name()));
            return {};
        }
        return j.get<std::vector<event::EventRecord>>();
    } catch (const nlohmann::json::exception& e) {
        log_warn(fmt::format("event poll {} returned an undecodable body: {}", url, e.what()));
        return {};
    }
}

std::optional<uint64_t> HttpEventSource::last_seq() const {
    auto resp = http::HttpClient::get(base + "/health", timeout_ms);
    if (!resp || !resp->ok()) return std::nullopt;
    auto j = nlohmann::json::parse(resp->body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    auto it = j.find("last_seq");
    if (it == j.end() || !it->is_number_unsigned()) return std::nullopt;
    return it->get<uint64_t>();
}
}
