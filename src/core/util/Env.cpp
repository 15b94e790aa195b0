#include "eventtap/core/util/Env.h"
#include "eventtap/core/util/Logger.h"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace eventtap::core::util {
std::string env_string(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    if (!v || !*v) return fallback;
    return v;
}

bool env_bool(const char* name, bool fallback) {
    std::string v = env_string(name, "");
    if (v.empty()) return fallback;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return char(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    log_warn(fmt::format("ignoring {}={}: not a boolean", name, v));
    return fallback;
}

int64_t env_int(const char* name, int64_t fallback) {
    std::string v = env_string(name, "");
    if (v.empty()) return fallback;
    char* end = nullptr;
    long long parsed = std::strtoll(v.c_str(), &end, 10);
    if (end == v.c_str() || *end != '\0') {
        log_warn(fmt::format("ignoring {}={}: not an integer", name, v));
        return fallback;
    }
    return parsed;
}
}
