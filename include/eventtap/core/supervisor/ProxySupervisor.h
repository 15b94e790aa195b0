#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <sys/types.h>
#include "eventtap/core/proxy/MirrorAddon.h"

namespace eventtap::core::supervisor {
struct SupervisorConfig {
    std::string proxy_binary { "eventtap_proxy" };  // bare names are looked up in PATH
    std::string host { "127.0.0.1" };               // where readiness and health are probed
    uint16_t port { 9090 };
    std::string log_dir { "artifacts/proxy" };
    std::string log_level { "info" };
    bool enable_mitm { false };
    std::vector<std::string> extra_args;            // listen-address flags are filtered out
    int start_timeout_ms { 5000 };
    int stop_grace_ms { 1000 };
    int health_timeout_ms { 1000 };
};

// A launched proxy process. pid is -1 once stopped.
struct ProxyHandle {
    pid_t pid { -1 };
    std::string host;
    uint16_t port { 0 };
    std::string log_path;
    std::string pid_file;
    bool running() const { return pid > 0; }
    std::string url() const;
};

// Runs eventtap_proxy as a child process in its own process group.
class ProxySupervisor {
public:
    explicit ProxySupervisor(SupervisorConfig cfg = {});
    // Throws SetupError when the port is taken, the binary is missing, or the
    // proxy does not listen within start_timeout_ms.
    ProxyHandle start(const proxy::MirrorConfig& target, const std::string& collector_url);
    bool is_healthy(const ProxyHandle& handle) const;
    // SIGTERM to the group, SIGKILL after the grace period. Safe to repeat.
    void stop(ProxyHandle& handle);
    const SupervisorConfig& config() const { return cfg; }
private:
    SupervisorConfig cfg;
};

// Drops flags that would move the proxy off the supervised address.
std::vector<std::string> filter_proxy_args(const std::vector<std::string>& args);
// True for variable names that look like credentials.
bool is_secret_env(const std::string& name);
// Absolute path of an executable, searching PATH for bare names.
std::optional<std::string> resolve_binary(const std::string& name);
}
