#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <utility>

namespace eventtap::core::http {
struct HttpHeader { std::string name; std::string value; };
struct HttpRequestLine { std::string method; std::string target; std::string version; };
struct HttpStatusLine { std::string version; int code{0}; std::string reason; };
struct HttpRequest { HttpRequestLine request_line; std::vector<HttpHeader> headers; };
struct HttpResponseHead { HttpStatusLine status_line; std::vector<HttpHeader> headers; };

// Case-insensitive lookup of the first header with the given name.
std::optional<std::string> find_header(const std::vector<HttpHeader>& headers, std::string_view name);
bool iequals(std::string_view a, std::string_view b);

class HttpParser {
public:
    std::optional<HttpRequestLine> parse_request_line(std::string_view line);
    std::optional<HttpStatusLine> parse_status_line(std::string_view line);
    std::optional<HttpRequest> parse_request(std::string_view data);
    std::optional<HttpResponseHead> parse_response_head(std::string_view data);
private:
    std::vector<HttpHeader> parse_headers(std::string_view block);
};
}
