#pragma once
#include <string>
#include <cstdint>

namespace eventtap::core::util {
// Environment lookups with a fallback for unset or empty variables.
std::string env_string(const char* name, const std::string& fallback);
// Accepts 1/0, true/false, yes/no, on/off (case-insensitive); anything else yields fallback.
bool env_bool(const char* name, bool fallback);
int64_t env_int(const char* name, int64_t fallback);
}
