#include "eventtap/core/http/MessageAssembler.h"
#include <algorithm>
#include <cctype>
#include <cstdint>

namespace eventtap::core::http {
namespace {
constexpr std::size_t kMaxHead = 64 * 1024;

bool has_token(std::string_view list, std::string_view token) {
    size_t pos = 0;
    while (pos <= list.size()) {
        auto comma = list.find(',', pos);
        auto item = list.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos);
        while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) item.remove_prefix(1);
        while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) item.remove_suffix(1);
        if (iequals(item, token)) return true;
        if (comma == std::string_view::npos) break;
        pos = comma + 1;
    }
    return false;
}

std::optional<std::size_t> parse_length(const std::string& v) {
    if (v.empty()) return std::nullopt;
    std::size_t n = 0;
    for (char c : v) {
        if (c < '0' || c > '9') return std::nullopt;
        if (n > (SIZE_MAX - 9) / 10) return std::nullopt;
        n = n * 10 + static_cast<std::size_t>(c - '0');
    }
    return n;
}
}

bool HttpMessage::keep_alive() const {
    auto conn = header("connection");
    std::string_view version = kind == MessageKind::Request ? request_line.version : status_line.version;
    if (conn) {
        if (has_token(*conn, "close")) return false;
        if (has_token(*conn, "keep-alive")) return true;
    }
    return version != "HTTP/1.0";
}

MessageAssembler::MessageAssembler(MessageKind kind, std::size_t max_body_bytes) : kind_(kind), max_body_(max_body_bytes) {}

void MessageAssembler::feed(std::string_view data) {
    if (failed()) return;
    pending_.append(data.data(), data.size());
    pump();
}

std::optional<HttpMessage> MessageAssembler::next() {
    if (ready_.empty()) return std::nullopt;
    HttpMessage m = std::move(ready_.front());
    ready_.pop_front();
    return m;
}

void MessageAssembler::expect_response_to(std::string_view method) {
    head_requests_.push_back(method == "HEAD");
}

void MessageAssembler::finish() {
    if (failed()) return;
    if (current_ && phase_ == Phase::UntilClose) {
        complete();
        return;
    }
    if (current_ || !pending_.empty()) fail(Error::Malformed);
}

void MessageAssembler::fail(Error e) {
    error_ = e;
    current_.reset();
    pending_.clear();
}

void MessageAssembler::complete() {
    ready_.push_back(std::move(*current_));
    current_.reset();
    phase_ = Phase::Head;
    remaining_ = 0;
}

bool MessageAssembler::start_message() {
    auto end = pending_.find("\r\n\r\n");
    if (end == std::string::npos) {
        if (pending_.size() > kMaxHead) fail(Error::TooLarge);
        return false;
    }
    // tolerate stray CRLF between pipelined messages
    std::size_t lead = 0;
    while (lead + 1 < pending_.size() && pending_[lead] == '\r' && pending_[lead + 1] == '\n' && lead < end) lead += 2;
    std::string head = pending_.substr(lead, end + 4 - lead);
    pending_.erase(0, end + 4);

    HttpMessage msg;
    msg.kind = kind_;
    if (kind_ == MessageKind::Request) {
        auto req = parser_.parse_request(head);
        if (!req) { fail(Error::Malformed); return false; }
        msg.request_line = std::move(req->request_line);
        msg.headers = std::move(req->headers);
    } else {
        auto resp = parser_.parse_response_head(head);
        if (!resp) { fail(Error::Malformed); return false; }
        msg.status_line = std::move(resp->status_line);
        msg.headers = std::move(resp->headers);
    }
    msg.head = std::move(head);

    auto te = msg.header("transfer-encoding");
    auto cl = msg.header("content-length");
    bool no_body = false;
    if (kind_ == MessageKind::Response) {
        int code = msg.status_line.code;
        bool informational = code >= 100 && code < 200;
        bool head_request = false;
        if (!informational && !head_requests_.empty()) { head_request = head_requests_.front(); head_requests_.pop_front(); }
        no_body = informational || code == 204 || code == 304 || head_request;
    }

    current_ = std::move(msg);
    if (no_body) { complete(); return true; }
    if (te && has_token(*te, "chunked")) {
        current_->chunked = true;
        chunked_ = ChunkedDecoder{};
        phase_ = Phase::Chunked;
        return true;
    }
    if (cl) {
        auto n = parse_length(*cl);
        if (!n) { fail(Error::Malformed); return false; }
        if (*n > max_body_) { fail(Error::TooLarge); return false; }
        remaining_ = *n;
        phase_ = Phase::Length;
        if (remaining_ == 0) complete();
        return true;
    }
    if (kind_ == MessageKind::Request) { complete(); return true; }
    phase_ = Phase::UntilClose;
    return true;
}

void MessageAssembler::pump() {
    while (!failed()) {
        if (!current_) {
            if (pending_.empty() || !start_message()) return;
            continue;
        }
        if (pending_.empty()) return;
        switch (phase_) {
            case Phase::Length: {
                std::size_t take = std::min(remaining_, pending_.size());
                current_->raw_body.append(pending_, 0, take);
                current_->body.append(pending_, 0, take);
                pending_.erase(0, take);
                remaining_ -= take;
                if (remaining_ == 0) complete();
                break;
            }
            case Phase::Chunked: {
                std::size_t used = chunked_.feed(pending_.data(), pending_.size());
                current_->raw_body.append(pending_, 0, used);
                current_->body += chunked_.take_decoded();
                pending_.erase(0, used);
                if (chunked_.error()) { fail(Error::Malformed); return; }
                if (current_->body.size() > max_body_) { fail(Error::TooLarge); return; }
                if (chunked_.finished()) complete();
                break;
            }
            case Phase::UntilClose: {
                current_->raw_body += pending_;
                current_->body += pending_;
                pending_.clear();
                if (current_->body.size() > max_body_) { fail(Error::TooLarge); return; }
                break;
            }
            case Phase::Head:
                return;
        }
    }
}
}
