#include "eventtap/core/net/UpstreamConnector.h"
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/select.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace eventtap::core::net {
std::optional<Socket> UpstreamConnector::connect(const std::string& host, uint16_t port, int timeout_ms, int io_timeout_ms) {
    auto port_str = std::to_string(port);
    addrinfo hints{}; hints.ai_family = AF_UNSPEC; hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    if (::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res) != 0) return std::nullopt;
    for (auto p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) continue;
        int flags = fcntl(s, F_GETFL, 0); fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int r = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (r < 0) {
            if (errno != EINPROGRESS) { ::close(s); continue; }
            fd_set wfds; FD_ZERO(&wfds); FD_SET(s, &wfds);
            timeval tv{ timeout_ms / 1000, (timeout_ms % 1000) * 1000 };
            if (select(s + 1, nullptr, &wfds, nullptr, &tv) <= 0) { ::close(s); continue; }
            int soerr = 0; socklen_t len = sizeof(soerr);
            if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &len) < 0 || soerr != 0) { ::close(s); continue; }
        }
        fcntl(s, F_SETFL, flags);
        ::freeaddrinfo(res);
        Socket sock(s);
        if (io_timeout_ms > 0) sock.set_timeouts(io_timeout_ms, io_timeout_ms);
        return sock;
    }
    if (res) ::freeaddrinfo(res);
    return std::nullopt;
}

bool UpstreamConnector::is_listening(const std::string& host, uint16_t port, int timeout_ms) {
    auto s = connect(host, port, timeout_ms);
    return s.has_value();
}
}
