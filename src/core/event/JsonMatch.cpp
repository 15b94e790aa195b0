#include "eventtap/core/event/JsonMatch.h"
#include <optional>

namespace eventtap::core::event::json_match {
using nlohmann::json;

namespace {
bool is_scalar(const json& v) { return v.is_primitive(); }

std::optional<json> parse_embedded(const json& v) {
    if (!v.is_string()) return std::nullopt;
    auto parsed = json::parse(v.get_ref<const std::string&>(), nullptr, false);
    if (parsed.is_discarded()) return std::nullopt;
    return parsed;
}
}

std::string scalar_string(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

bool matches(const json& actual, const json& expected) {
    if (is_scalar(actual) && is_scalar(expected)) {
        if (expected.is_string()) {
            const auto& pattern = expected.get_ref<const std::string&>();
            if (pattern == "*") return true;
            if (pattern.empty()) return actual.is_string() && actual.get_ref<const std::string&>().empty();
            if (pattern.front() == '~') {
                return actual.is_string() && actual.get_ref<const std::string&>().find(pattern.substr(1)) != std::string::npos;
            }
            return scalar_string(actual) == pattern;
        }
        return actual == expected;
    }
    if (actual.is_object() && expected.is_object()) {
        for (auto it = expected.begin(); it != expected.end(); ++it) {
            auto found = actual.find(it.key());
            if (found == actual.end()) return false;
            if (!matches(*found, it.value())) return false;
        }
        return true;
    }
    if (actual.is_array() && expected.is_array()) {
        for (const auto& want : expected) {
            bool hit = false;
            for (const auto& have : actual) {
                if (matches(have, want)) { hit = true; break; }
            }
            if (!hit) return false;
        }
        return true;
    }
    // structured expectation against a string that may carry serialized JSON
    if (auto parsed = parse_embedded(actual)) {
        if (parsed->is_string()) return false;
        return matches(*parsed, expected);
    }
    return false;
}

bool find_key_value(const json& tree, const std::string& key, const json& expected) {
    if (tree.is_object()) {
        for (auto it = tree.begin(); it != tree.end(); ++it) {
            if (it.key() == key && matches(it.value(), expected)) return true;
            if (find_key_value(it.value(), key, expected)) return true;
        }
        return false;
    }
    if (tree.is_array()) {
        for (const auto& item : tree) {
            if (find_key_value(item, key, expected)) return true;
        }
    }
    return false;
}

bool contains(const json& payload, const json& expected_object) {
    if (!expected_object.is_object()) return false;
    const json* data = nullptr;
    if (payload.is_object()) {
        auto ev = payload.find("event");
        if (ev != payload.end() && ev->is_object() && ev->contains("data")) data = &(*ev)["data"];
        else if (payload.contains("data")) data = &payload["data"];
    }
    for (auto it = expected_object.begin(); it != expected_object.end(); ++it) {
        bool found = data && find_key_value(*data, it.key(), it.value());
        if (!found) found = find_key_value(payload, it.key(), it.value());
        if (!found) return false;
    }
    return true;
}
}
