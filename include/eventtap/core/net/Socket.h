#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include <vector>

namespace eventtap::core::net {
class Socket {
public:
    Socket();
    explicit Socket(int fd);
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;
    ~Socket();
    bool valid() const;
    int native() const;
    void close();
    // Unblocks any thread parked in recv on this socket without releasing the descriptor.
    void shutdown();
    bool set_non_blocking();
    bool set_timeouts(int recv_ms, int send_ms);
    // Returns true when data (or EOF) is readable within timeout_ms.
    bool wait_readable(int timeout_ms) const;
    // Bytes read; nullopt on EOF, error or receive timeout.
    std::optional<int> recv_some(std::vector<char>& buffer);
    bool send_all(std::string_view data);
private:
    int handle{-1};
};

class Listener {
public:
    Listener();
    ~Listener();
    // Port 0 binds an ephemeral port, see bound_port().
    bool open(uint16_t port, const std::string& bind_host = "0.0.0.0");
    // Returns true when a connection is pending within timeout_ms.
    bool wait_acceptable(int timeout_ms) const;
    Socket accept();
    void close();
    bool valid() const;
    int native() const;
    uint16_t bound_port() const;
private:
    int handle{-1};
};
}
