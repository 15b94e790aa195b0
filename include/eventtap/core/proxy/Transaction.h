#pragma once
#include <string>
#include <chrono>
#include <cstdint>
#include <vector>
#include "eventtap/core/http/HttpParser.h"

namespace eventtap::core::proxy {
// A client request the proxy has read completely (plain HTTP or decrypted HTTPS).
struct InterceptedRequest {
    uint64_t session_id{0};
    std::string method;
    std::string host;  // lowercase, no port
    uint16_t port{80};
    std::string path;  // origin-form target, query included
    std::vector<http::HttpHeader> headers;
    std::string body;  // after transfer decoding
    bool tls{false};
    std::chrono::system_clock::time_point received_at;

    std::string content_type() const { return http::find_header(headers, "content-type").value_or(""); }
};

// One finished exchange or tunnel, for logging.
struct Transaction {
    uint64_t id{0};
    std::chrono::steady_clock::time_point startTime;
    std::chrono::system_clock::time_point wallTime;
    std::string requestLine;
    std::string host;
    uint64_t bytesIn{0};   // client -> proxy
    uint64_t bytesOut{0};  // proxy -> client
    int status{0};         // 0 when no response was relayed
    bool tlsMitmIntercepted{false};
    std::string mitmOutcome; // "intercepted", "tunneled", "pinned", "handshake-fail", "internal"
};

class TransactionObserver {
public:
    virtual ~TransactionObserver() = default;
    // Called on the session thread before the request is forwarded. Must not block.
    virtual void on_request(const InterceptedRequest&) {}
    virtual void on_transaction(const Transaction&) {}
};
}
