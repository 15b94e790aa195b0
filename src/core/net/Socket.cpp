#include "eventtap/core/net/Socket.h"
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/select.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <cstring>

namespace eventtap::core::net {
namespace {
inline bool set_nb(int fd) {
    int flags = fcntl(fd, F_GETFL, 0); if (flags < 0) return false; return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}
inline bool set_blocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0); if (flags < 0) return false; return fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) == 0;
}
inline timeval to_timeval(int ms) { return timeval{ ms / 1000, (ms % 1000) * 1000 }; }
}

Socket::Socket() = default;
Socket::Socket(int fd) : handle(fd) {}
Socket::Socket(Socket&& other) noexcept : handle(other.handle) { other.handle = -1; }
Socket& Socket::operator=(Socket&& other) noexcept { if (this != &other) { close(); handle = other.handle; other.handle = -1; } return *this; }
Socket::~Socket() { close(); }
bool Socket::valid() const { return handle >= 0; }
int Socket::native() const { return handle; }
void Socket::close() { if (handle >= 0) { ::close(handle); handle = -1; } }
void Socket::shutdown() { if (handle >= 0) ::shutdown(handle, SHUT_RDWR); }
bool Socket::set_non_blocking() { if (!valid()) return false; return set_nb(handle); }

bool Socket::set_timeouts(int recv_ms, int send_ms) {
    if (!valid()) return false;
    timeval rtv = to_timeval(recv_ms);
    timeval stv = to_timeval(send_ms);
    bool ok = setsockopt(handle, SOL_SOCKET, SO_RCVTIMEO, &rtv, sizeof(rtv)) == 0;
    ok = setsockopt(handle, SOL_SOCKET, SO_SNDTIMEO, &stv, sizeof(stv)) == 0 && ok;
    return ok;
}

bool Socket::wait_readable(int timeout_ms) const {
    if (!valid()) return false;
    fd_set rfds; FD_ZERO(&rfds); FD_SET(handle, &rfds);
    timeval tv = to_timeval(timeout_ms);
    return ::select(handle + 1, &rfds, nullptr, nullptr, &tv) > 0;
}

std::optional<int> Socket::recv_some(std::vector<char>& buffer) {
    if (!valid()) return std::nullopt;
    int r = static_cast<int>(::recv(handle, buffer.data(), buffer.size(), 0));
    if (r <= 0) return std::nullopt; return r;
}

bool Socket::send_all(std::string_view data) {
    if (!valid()) return false;
    const char* p = data.data(); size_t remaining = data.size();
    while (remaining > 0) {
        int sent = static_cast<int>(::send(handle, p, remaining, MSG_NOSIGNAL));
        if (sent <= 0) return false; p += sent; remaining -= sent;
    }
    return true;
}

Listener::Listener() = default;
Listener::~Listener() { close(); }
bool Listener::valid() const { return handle >= 0; }
int Listener::native() const { return handle; }
void Listener::close() { if (handle >= 0) { ::close(handle); handle = -1; } }
bool Listener::open(uint16_t port, const std::string& bind_host) {
    handle = ::socket(AF_INET, SOCK_STREAM, 0);
    if (handle < 0) return false;
    int yes = 1;
    setsockopt(handle, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    sockaddr_in addr{}; addr.sin_family = AF_INET; addr.sin_port = htons(port);
    if (inet_pton(AF_INET, bind_host.c_str(), &addr.sin_addr) != 1) { close(); return false; }
    if (bind(handle, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) { close(); return false; }
    if (listen(handle, 128) < 0) { close(); return false; }
    set_nb(handle);
    return true;
}
uint16_t Listener::bound_port() const {
    if (!valid()) return 0;
    sockaddr_in addr{}; socklen_t len = sizeof(addr);
    if (getsockname(handle, reinterpret_cast<sockaddr*>(&addr), &len) < 0) return 0;
    return ntohs(addr.sin_port);
}
bool Listener::wait_acceptable(int timeout_ms) const {
    if (!valid()) return false;
    fd_set rfds; FD_ZERO(&rfds); FD_SET(handle, &rfds);
    timeval tv = to_timeval(timeout_ms);
    return ::select(handle + 1, &rfds, nullptr, nullptr, &tv) > 0;
}
Socket Listener::accept() {
    if (!valid()) return Socket();
    sockaddr_in addr{}; socklen_t len = sizeof(addr);
    int c = ::accept(handle, reinterpret_cast<sockaddr*>(&addr), &len);
    if (c < 0) return Socket();
    // accepted sockets may inherit O_NONBLOCK; sessions use blocking I/O with timeouts
    set_blocking(c);
    return Socket(c);
}
}
