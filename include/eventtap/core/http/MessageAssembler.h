#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <deque>
#include <optional>
#include <cstddef>
#include "eventtap/core/http/HttpParser.h"
#include "eventtap/core/http/ChunkedDecoder.h"

namespace eventtap::core::http {
enum class MessageKind { Request, Response };

struct HttpMessage {
    MessageKind kind{MessageKind::Request};
    HttpRequestLine request_line;  // requests only
    HttpStatusLine status_line;    // responses only
    std::vector<HttpHeader> headers;
    std::string head;       // start line and headers as received, including the blank line
    std::string raw_body;   // body bytes exactly as framed on the wire
    std::string body;       // body after transfer decoding
    bool chunked{false};

    std::optional<std::string> header(std::string_view name) const { return find_header(headers, name); }
    // HTTP/1.1 defaults to persistent, HTTP/1.0 to close; Connection header overrides.
    bool keep_alive() const;
};

// Splits a byte stream into complete HTTP/1.x messages. Handles Content-Length,
// chunked and (for responses) close-delimited bodies, and pipelined input.
class MessageAssembler {
public:
    enum class Error { None, Malformed, TooLarge };

    explicit MessageAssembler(MessageKind kind, std::size_t max_body_bytes = 64 * 1024 * 1024);

    void feed(std::string_view data);
    std::optional<HttpMessage> next();
    // Responses: records the method of the request the next response answers (HEAD has no body).
    void expect_response_to(std::string_view method);
    // Peer closed the stream; completes a close-delimited response body.
    void finish();

    bool failed() const { return error_ != Error::None; }
    Error error() const { return error_; }
    // A message has started but is not complete yet.
    bool in_progress() const { return current_.has_value() || !pending_.empty(); }

private:
    enum class Phase { Head, Length, Chunked, UntilClose };
    MessageKind kind_;
    std::size_t max_body_;
    std::string pending_;
    std::optional<HttpMessage> current_;
    Phase phase_{Phase::Head};
    std::size_t remaining_{0};
    ChunkedDecoder chunked_;
    std::deque<bool> head_requests_;
    std::deque<HttpMessage> ready_;
    Error error_{Error::None};
    HttpParser parser_;

    void pump();
    bool start_message();
    void complete();
    void fail(Error e);
};
}
