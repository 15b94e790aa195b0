#pragma once
#include <string>
#include <optional>
#include "eventtap/core/net/Socket.h"

namespace eventtap::core::net {
class UpstreamConnector {
public:
    // Connected blocking socket; recv/send timeouts are set to io_timeout_ms when positive.
    static std::optional<Socket> connect(const std::string& host, uint16_t port, int timeout_ms = 3000, int io_timeout_ms = 0);
    // True if something accepts TCP connections on host:port.
    static bool is_listening(const std::string& host, uint16_t port, int timeout_ms = 600);
};
}
