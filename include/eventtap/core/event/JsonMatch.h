#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace eventtap::core::event::json_match {
// Recursive subset match of `expected` against `actual`.
// Expected strings: "*" matches anything, "" only an empty string, "~text" is a
// substring test, anything else compares with the actual value's string form.
// Objects match key by key, arrays order-agnostically, and an actual string that
// holds serialized JSON is parsed before matching a structured expectation.
bool matches(const nlohmann::json& actual, const nlohmann::json& expected);

// Depth-first search for `key` anywhere in the tree with a value that matches().
bool find_key_value(const nlohmann::json& tree, const std::string& key, const nlohmann::json& expected);

// Every (key, value) pair of expected_object is found somewhere in payload.
// An "event.data" or "data" node is searched first when present.
bool contains(const nlohmann::json& payload, const nlohmann::json& expected_object);

// String form used when comparing a primitive against an expected string.
std::string scalar_string(const nlohmann::json& v);
}
