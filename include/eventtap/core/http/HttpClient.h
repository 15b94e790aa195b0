#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>
#include "eventtap/core/http/HttpParser.h"

namespace eventtap::core::http {
struct Url {
    std::string scheme;   // "http" only is supported by HttpClient
    std::string host;
    uint16_t port{80};
    std::string target{"/"};  // path plus query
};
// "http://127.0.0.1:8000/event?x=1" -> {http, 127.0.0.1, 8000, /event?x=1}
std::optional<Url> parse_url(std::string_view url);

struct HttpResponse {
    int status{0};
    std::vector<HttpHeader> headers;
    std::string body;
    bool ok() const { return status >= 200 && status < 300; }
};

// Minimal blocking HTTP/1.1 client, one connection per request.
// timeout_ms bounds connect and every read/write; nullopt on any transport failure.
class HttpClient {
public:
    static std::optional<HttpResponse> request(const Url& url, const std::string& method, std::string_view body = {},
                                               const std::string& content_type = {}, int timeout_ms = 2000);
    static std::optional<HttpResponse> get(const std::string& url, int timeout_ms = 2000);
    static std::optional<HttpResponse> post(const std::string& url, std::string_view body, const std::string& content_type, int timeout_ms = 2000);
};
}
