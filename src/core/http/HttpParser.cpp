#include "eventtap/core/http/HttpParser.h"
#include <cctype>
#include <string_view>

namespace eventtap::core::http {
bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

std::optional<std::string> find_header(const std::vector<HttpHeader>& headers, std::string_view name) {
    for (auto& h : headers) {
        if (iequals(h.name, name)) return h.value;
    }
    return std::nullopt;
}

std::optional<HttpRequestLine> HttpParser::parse_request_line(std::string_view line) {
    auto first_space = line.find(' ');
    if (first_space == std::string_view::npos) return std::nullopt;
    auto second_space = line.find(' ', first_space + 1);
    if (second_space == std::string_view::npos) return std::nullopt;
    HttpRequestLine rl;
    rl.method = std::string(line.substr(0, first_space));
    rl.target = std::string(line.substr(first_space + 1, second_space - first_space - 1));
    rl.version = std::string(line.substr(second_space + 1));
    if (rl.method.empty() || rl.target.empty()) return std::nullopt;
    return rl;
}

std::optional<HttpStatusLine> HttpParser::parse_status_line(std::string_view line) {
    // HTTP/1.1 200 OK  (reason phrase may be empty)
    if (line.substr(0, 5) != "HTTP/") return std::nullopt;
    auto first_space = line.find(' ');
    if (first_space == std::string_view::npos) return std::nullopt;
    auto code_end = line.find(' ', first_space + 1);
    auto code_str = line.substr(first_space + 1, code_end == std::string_view::npos ? std::string_view::npos : code_end - first_space - 1);
    if (code_str.size() != 3) return std::nullopt;
    int code = 0;
    for (char c : code_str) {
        if (c < '0' || c > '9') return std::nullopt;
        code = code * 10 + (c - '0');
    }
    HttpStatusLine sl;
    sl.version = std::string(line.substr(0, first_space));
    sl.code = code;
    if (code_end != std::string_view::npos) sl.reason = std::string(line.substr(code_end + 1));
    return sl;
}

std::vector<HttpHeader> HttpParser::parse_headers(std::string_view block) {
    std::vector<HttpHeader> headers;
    size_t pos = 0;
    while (pos < block.size()) {
        auto next = block.find("\r\n", pos);
        auto line = block.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos);
        if (line.empty()) break;
        auto colon = line.find(':');
        if (colon != std::string_view::npos) {
            std::string name(line.substr(0, colon));
            size_t value_start = colon + 1;
            while (value_start < line.size() && (line[value_start] == ' ' || line[value_start] == '\t')) value_start++;
            size_t value_end = line.size();
            while (value_end > value_start && (line[value_end - 1] == ' ' || line[value_end - 1] == '\t')) value_end--;
            std::string value(line.substr(value_start, value_end - value_start));
            headers.push_back(HttpHeader{ std::move(name), std::move(value) });
        }
        if (next == std::string_view::npos) break;
        pos = next + 2;
    }
    return headers;
}

std::optional<HttpRequest> HttpParser::parse_request(std::string_view data) {
    auto end_headers = data.find("\r\n\r\n");
    if (end_headers == std::string_view::npos) return std::nullopt;
    std::string_view head = data.substr(0, end_headers);
    auto first_eol = head.find("\r\n");
    auto rl_opt = parse_request_line(head.substr(0, first_eol));
    if (!rl_opt) return std::nullopt;
    HttpRequest req; req.request_line = *rl_opt;
    if (first_eol != std::string_view::npos) req.headers = parse_headers(head.substr(first_eol + 2));
    return req;
}

std::optional<HttpResponseHead> HttpParser::parse_response_head(std::string_view data) {
    auto end_headers = data.find("\r\n\r\n");
    if (end_headers == std::string_view::npos) return std::nullopt;
    std::string_view head = data.substr(0, end_headers);
    auto first_eol = head.find("\r\n");
    auto sl_opt = parse_status_line(head.substr(0, first_eol));
    if (!sl_opt) return std::nullopt;
    HttpResponseHead resp; resp.status_line = *sl_opt;
    if (first_eol != std::string_view::npos) resp.headers = parse_headers(head.substr(first_eol + 2));
    return resp;
}
}
