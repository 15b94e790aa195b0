#include "eventtap/core/http/HostUtil.h"
#include <algorithm>
#include <cctype>

namespace eventtap::core::http {
static std::string to_lower(std::string v) { std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return char(std::tolower(c)); }); return v; }

static bool parse_port(std::string_view s, uint16_t& port) {
    int p = 0;
    for (char c : s) { if (c < '0' || c > '9') return false; p = p * 10 + (c - '0'); if (p > 65535) return false; }
    if (p > 0) port = static_cast<uint16_t>(p);
    return true;
}

// [v6]:port, host:port or bare host
static bool split_host_port(std::string& host, uint16_t& port) {
    if (!host.empty() && host.front() == '[') {
        auto close = host.find(']');
        if (close == std::string::npos) return false;
        std::string rest = host.substr(close + 1);
        host = host.substr(1, close - 1);
        if (rest.empty()) return true;
        if (rest.front() != ':') return false;
        return parse_port(std::string_view(rest).substr(1), port);
    }
    auto colon = host.find(':');
    if (colon == std::string::npos) return true;
    auto port_str = host.substr(colon + 1);
    host.erase(colon);
    return parse_port(port_str, port);
}

std::optional<HostTarget> extract_host_target(const HttpRequest& req, uint16_t default_port) {
    std::string host_header = find_header(req.headers, "host").value_or("");
    std::string path = req.request_line.target;
    uint16_t port = default_port;
    auto lowered = to_lower(path.substr(0, 8));
    if (lowered.rfind("http://", 0) == 0 || lowered.rfind("https://", 0) == 0) {
        if (lowered.rfind("https://", 0) == 0) port = 443;
        auto after = path.find("//") + 2;
        auto slash = path.find('/', after);
        auto authority = path.substr(after, slash == std::string::npos ? std::string::npos : slash - after);
        if (host_header.empty()) host_header = authority;
        path = slash != std::string::npos ? path.substr(slash) : std::string("/");
    }
    if (host_header.empty()) return std::nullopt;
    std::string host = host_header;
    if (!split_host_port(host, port)) return std::nullopt;
    if (host.empty()) return std::nullopt;
    return HostTarget{ to_lower(host), port, path };
}

std::string_view path_without_query(std::string_view target) {
    auto q = target.find_first_of("?#");
    return q == std::string_view::npos ? target : target.substr(0, q);
}

std::string percent_decode(std::string_view in) {
    std::string out; out.reserve(in.size());
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        return -1;
    };
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size() && hex(in[i+1]) >= 0 && hex(in[i+2]) >= 0) {
            out.push_back(static_cast<char>(hex(in[i+1]) * 16 + hex(in[i+2])));
            i += 2;
        } else if (in[i] == '+') {
            out.push_back(' ');
        } else {
            out.push_back(in[i]);
        }
    }
    return out;
}

std::optional<std::string> query_param(std::string_view target, std::string_view key) {
    auto q = target.find('?');
    if (q == std::string_view::npos) return std::nullopt;
    auto query = target.substr(q + 1);
    auto hash = query.find('#');
    if (hash != std::string_view::npos) query = query.substr(0, hash);
    size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        auto pair = query.substr(pos, amp == std::string_view::npos ? std::string_view::npos : amp - pos);
        auto eq = pair.find('=');
        auto k = pair.substr(0, eq);
        if (percent_decode(k) == key) {
            return eq == std::string_view::npos ? std::string() : percent_decode(pair.substr(eq + 1));
        }
        if (amp == std::string_view::npos) break;
        pos = amp + 1;
    }
    return std::nullopt;
}
}
