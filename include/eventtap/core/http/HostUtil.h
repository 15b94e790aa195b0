#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>
#include "eventtap/core/http/HttpParser.h"

namespace eventtap::core::http {
struct HostTarget {
    std::string host;
    uint16_t port{80};
    std::string path;
};
// Host from the Host header (or absolute-form target), path in origin-form.
std::optional<HostTarget> extract_host_target(const HttpRequest& req, uint16_t default_port = 80);
// "/batch?x=1" -> "/batch"
std::string_view path_without_query(std::string_view target);
// Percent-decoded value of a query parameter, nullopt when absent.
std::optional<std::string> query_param(std::string_view target, std::string_view key);
std::string percent_decode(std::string_view in);
}
