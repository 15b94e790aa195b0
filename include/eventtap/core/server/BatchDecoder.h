#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace eventtap::core::server {
struct DecodedEvent {
    std::string name;
    nlohmann::json payload;
};

struct DecodeIssue {
    std::size_t index{0};  // 0-based element position within the batch
    std::string reason;
};

struct DecodeResult {
    std::vector<DecodedEvent> events;
    std::vector<DecodeIssue> issues;
    std::size_t elements{0};  // elements seen, accepted or not
    std::string error;        // set when the body as a whole is unusable

    // True when the request should be rejected with 400.
    bool rejected() const { return !error.empty(); }
};

struct DecoderOptions {
    std::string name_field { "name" };
    std::string name_fallback_path { "event.name" };
    std::string envelope_field { "events" };
};

// Turns a POST /event body into individual events.
// Accepts one object, an array of objects (string elements holding serialized
// objects are decoded) or an {"events":[...]} envelope. Elements that cannot
// be decoded become issues; only an unparsable body or a top-level scalar is an error.
class BatchDecoder {
public:
    explicit BatchDecoder(DecoderOptions options = {});
    DecodeResult decode(std::string_view body) const;
    // name_field, then name_fallback_path, then "unknown".
    std::string extract_name(const nlohmann::json& payload) const;
private:
    DecoderOptions opts;
    void add_element(DecodeResult& out, const nlohmann::json& element) const;
};
}
