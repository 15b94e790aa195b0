#include "eventtap/core/http/HttpClient.h"
#include "eventtap/core/http/MessageAssembler.h"
#include "eventtap/core/net/UpstreamConnector.h"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

namespace eventtap::core::http {
std::optional<Url> parse_url(std::string_view url) {
    auto sep = url.find("://");
    if (sep == std::string_view::npos) return std::nullopt;
    Url out;
    out.scheme = std::string(url.substr(0, sep));
    std::transform(out.scheme.begin(), out.scheme.end(), out.scheme.begin(), [](unsigned char c){ return char(std::tolower(c)); });
    if (out.scheme == "https") out.port = 443;
    else if (out.scheme != "http") return std::nullopt;
    auto rest = url.substr(sep + 3);
    auto slash = rest.find_first_of("/?");
    auto authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) {
        out.target = std::string(rest.substr(slash));
        if (out.target.front() == '?') out.target.insert(0, "/");
    }
    if (authority.empty()) return std::nullopt;
    std::string_view host = authority;
    std::string_view port;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        host = authority.substr(1, close - 1);
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return std::nullopt;
            port = after.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }
    }
    if (host.empty()) return std::nullopt;
    out.host = std::string(host);
    if (!port.empty()) {
        int p = 0;
        for (char c : port) {
            if (c < '0' || c > '9') return std::nullopt;
            p = p * 10 + (c - '0');
            if (p > 65535) return std::nullopt;
        }
        if (p == 0) return std::nullopt;
        out.port = static_cast<uint16_t>(p);
    }
    return out;
}

std::optional<HttpResponse> HttpClient::request(const Url& url, const std::string& method, std::string_view body,
                                                const std::string& content_type, int timeout_ms) {
    if (url.scheme != "http") return std::nullopt;
    auto sock = net::UpstreamConnector::connect(url.host, url.port, timeout_ms, timeout_ms);
    if (!sock) return std::nullopt;

    std::string host_header = url.host.find(':') != std::string::npos ? fmt::format("[{}]", url.host) : url.host;
    if (url.port != 80) host_header += fmt::format(":{}", url.port);
    std::string head = fmt::format("{} {} HTTP/1.1\r\nHost: {}\r\nConnection: close\r\n", method, url.target, host_header);
    if (!content_type.empty()) head += fmt::format("Content-Type: {}\r\n", content_type);
    if (!body.empty() || method == "POST" || method == "PUT") head += fmt::format("Content-Length: {}\r\n", body.size());
    head += "\r\n";
    if (!sock->send_all(head)) return std::nullopt;
    if (!body.empty() && !sock->send_all(body)) return std::nullopt;

    MessageAssembler assembler(MessageKind::Response);
    assembler.expect_response_to(method);
    std::vector<char> buffer(16384);
    while (true) {
        if (auto msg = assembler.next()) {
            // skip interim 1xx responses
            if (msg->status_line.code >= 100 && msg->status_line.code < 200) continue;
            return HttpResponse{ msg->status_line.code, std::move(msg->headers), std::move(msg->body) };
        }
        if (assembler.failed()) return std::nullopt;
        auto r = sock->recv_some(buffer);
        if (!r) {
            assembler.finish();
            if (auto msg = assembler.next()) return HttpResponse{ msg->status_line.code, std::move(msg->headers), std::move(msg->body) };
            return std::nullopt;
        }
        assembler.feed(std::string_view(buffer.data(), static_cast<size_t>(*r)));
    }
}

std::optional<HttpResponse> HttpClient::get(const std::string& url, int timeout_ms) {
    auto u = parse_url(url);
    if (!u) return std::nullopt;
    return request(*u, "GET", {}, {}, timeout_ms);
}

std::optional<HttpResponse> HttpClient::post(const std::string& url, std::string_view body, const std::string& content_type, int timeout_ms) {
    auto u = parse_url(url);
    if (!u) return std::nullopt;
    return request(*u, "POST", body, content_type, timeout_ms);
}
}
