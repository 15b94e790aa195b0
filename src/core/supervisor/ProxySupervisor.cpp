#include "eventtap/core/supervisor/ProxySupervisor.h"
#include "eventtap/core/Error.h"
#include "eventtap/core/net/UpstreamConnector.h"
#include "eventtap/core/http/HttpClient.h"
#include "eventtap/core/util/Logger.h"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace eventtap::core::supervisor {
using eventtap::core::util::log_info;
using eventtap::core::util::log_warn;
using namespace std::chrono;

namespace {
constexpr const char* kOverriddenEnv[] = {
    "EVENTTAP_TARGET_HOST", "EVENTTAP_TARGET_PATH", "EVENTTAP_COLLECTOR_URL",
    "EVENTTAP_MIRROR_ENABLED", "EVENTTAP_MIRROR_TIMEOUT_MS", "EVENTTAP_MIRROR_QUEUE",
};

std::string timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d_%H-%M-%S", &tm);
    return buf;
}

std::string describe_status(int status) {
    if (WIFEXITED(status)) return fmt::format("exit code {}", WEXITSTATUS(status));
    if (WIFSIGNALED(status)) return fmt::format("signal {}", WTERMSIG(status));
    return fmt::format("status {}", status);
}

// true once the child is gone (reaped here or no longer ours)
bool wait_exit(pid_t pid, milliseconds limit) {
    auto deadline = steady_clock::now() + limit;
    while (true) {
        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) return true;
        if (r == -1 && errno == ECHILD) return true;
        if (steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(milliseconds(20));
    }
}

std::vector<std::string> child_environment(const proxy::MirrorConfig& target, const std::string& collector_url) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string name = entry.substr(0, eq);
        if (is_secret_env(name)) continue;
        bool overridden = std::any_of(std::begin(kOverriddenEnv), std::end(kOverriddenEnv), [&](const char* n){ return name == n; });
        if (overridden) continue;
        env.push_back(std::move(entry));
    }
    env.push_back("EVENTTAP_TARGET_HOST=" + target.target_host);
    env.push_back("EVENTTAP_TARGET_PATH=" + target.target_path);
    env.push_back("EVENTTAP_COLLECTOR_URL=" + collector_url);
    env.push_back(std::string("EVENTTAP_MIRROR_ENABLED=") + (target.enabled ? "1" : "0"));
    env.push_back(fmt::format("EVENTTAP_MIRROR_TIMEOUT_MS={}", target.forward_timeout_ms));
    env.push_back(fmt::format("EVENTTAP_MIRROR_QUEUE={}", target.queue_capacity));
    return env;
}

std::vector<char*> as_argv(std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (auto& s : items) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

void remove_file(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) log_warn(fmt::format("cannot remove {}: {}", path, ec.message()));
}
}

std::string ProxyHandle::url() const { return fmt::format("http://{}:{}", host, port); }

bool is_secret_env(const std::string& name) {
    static const char* blocked[] = { "KEY", "TOKEN", "SECRET", "PASSWORD", "AWS", "AZURE", "GCP", "GOOGLE_APPLICATION_CREDENTIALS" };
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    for (const char* b : blocked) {
        if (upper.find(b) != std::string::npos) return true;
    }
    return false;
}

std::vector<std::string> filter_proxy_args(const std::vector<std::string>& args) {
    static const char* blockedExact[] = { "--port", "-p", "--listen-port", "--listen-host", "--bind-host" };
    static const char* blockedPrefix[] = { "--port=", "--listen-", "--bind-" };
    std::vector<std::string> out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        bool exact = std::any_of(std::begin(blockedExact), std::end(blockedExact), [&](const char* b){ return a == b; });
        bool prefixed = std::any_of(std::begin(blockedPrefix), std::end(blockedPrefix), [&](const char* b){ return a.rfind(b, 0) == 0; });
        if (exact || prefixed) {
            // a separate value follows unless it looks like the next flag
            if (a.find('=') == std::string::npos && i + 1 < args.size() && args[i + 1].rfind("-", 0) != 0) ++i;
            continue;
        }
        out.push_back(a);
    }
    return out;
}

std::optional<std::string> resolve_binary(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) != 0) return std::nullopt;
        std::error_code ec;
        auto abs = std::filesystem::absolute(name, ec);
        return ec ? name : abs.string();
    }
    const char* path = std::getenv("PATH");
    std::string dirs = path ? path : "/usr/local/bin:/usr/bin:/bin";
    std::size_t pos = 0;
    while (pos <= dirs.size()) {
        auto colon = dirs.find(':', pos);
        std::string dir = dirs.substr(pos, colon == std::string::npos ? std::string::npos : colon - pos);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) return candidate;
        if (colon == std::string::npos) break;
        pos = colon + 1;
    }
    return std::nullopt;
}

ProxySupervisor::ProxySupervisor(SupervisorConfig c) : cfg(std::move(c)) {}

ProxyHandle ProxySupervisor::start(const proxy::MirrorConfig& target, const std::string& collector_url) {
    auto binary = resolve_binary(cfg.proxy_binary);
    if (!binary) throw SetupError(fmt::format("proxy binary '{}' not found or not executable", cfg.proxy_binary));
    if (net::UpstreamConnector::is_listening(cfg.host, cfg.port)) {
        throw SetupError(fmt::format("port {}:{} is already in use", cfg.host, cfg.port));
    }
    std::error_code ec;
    std::filesystem::create_directories(cfg.log_dir, ec);
    if (ec) throw SetupError(fmt::format("cannot create log directory {}: {}", cfg.log_dir, ec.message()));

    ProxyHandle handle;
    handle.host = cfg.host;
    handle.port = cfg.port;
    handle.log_path = (std::filesystem::path(cfg.log_dir) / fmt::format("proxy_{}.log", timestamp())).string();
    handle.pid_file = (std::filesystem::path(cfg.log_dir) / "proxy.pid").string();

    std::vector<std::string> args{ *binary, "--port", std::to_string(cfg.port), "--log-level", cfg.log_level };
    if (cfg.enable_mitm) args.emplace_back("--enable-mitm");
    for (auto& a : filter_proxy_args(cfg.extra_args)) args.push_back(std::move(a));
    auto env = child_environment(target, collector_url);
    auto argv = as_argv(args);
    auto envp = as_argv(env);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, handle.log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    posix_spawn_file_actions_adddup2(&actions, STDOUT_FILENO, STDERR_FILENO);

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t none, defaults;
    sigemptyset(&none);
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGPIPE);
    sigaddset(&defaults, SIGTERM);
    sigaddset(&defaults, SIGINT);
    posix_spawnattr_setsigmask(&attr, &none);
    posix_spawnattr_setsigdefault(&attr, &defaults);
    posix_spawnattr_setpgroup(&attr, 0);  // own group, so stop() can signal all of it
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

    pid_t pid = -1;
    int rc = ::posix_spawn(&pid, binary->c_str(), &actions, &attr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
    if (rc != 0) throw SetupError(fmt::format("cannot launch {}: {}", *binary, std::strerror(rc)));
    handle.pid = pid;

    {
        std::ofstream pf(handle.pid_file, std::ios::trunc);
        pf << pid << "\n";
        if (!pf) log_warn(fmt::format("cannot write pid file {}", handle.pid_file));
    }
    log_info(fmt::format("proxy launched pid {} on {}:{} (log {})", pid, cfg.host, cfg.port, handle.log_path));

    auto deadline = steady_clock::now() + milliseconds(cfg.start_timeout_ms);
    while (true) {
        int status = 0;
        if (::waitpid(pid, &status, WNOHANG) == pid) {
            handle.pid = -1;
            remove_file(handle.pid_file);
            throw SetupError(fmt::format("proxy exited during startup ({}); see {}", describe_status(status), handle.log_path));
        }
        if (net::UpstreamConnector::is_listening(cfg.host, cfg.port, 300)) break;
        if (steady_clock::now() >= deadline) {
            stop(handle);
            throw SetupError(fmt::format("proxy did not listen on {}:{} within {} ms; see {}", cfg.host, cfg.port, cfg.start_timeout_ms, handle.log_path));
        }
        std::this_thread::sleep_for(milliseconds(150));
    }
    log_info(fmt::format("proxy listening on {}:{} pid {}", cfg.host, cfg.port, pid));
    return handle;
}

bool ProxySupervisor::is_healthy(const ProxyHandle& handle) const {
    if (!handle.running()) return false;
    if (::kill(handle.pid, 0) != 0) return false;
    auto resp = http::HttpClient::get(handle.url() + "/__eventtap/health", cfg.health_timeout_ms);
    return resp && resp->status == 200;
}

void ProxySupervisor::stop(ProxyHandle& handle) {
    if (!handle.running()) return;
    pid_t pid = handle.pid;
    log_info(fmt::format("stopping proxy pid {}", pid));
    if (::killpg(pid, SIGTERM) != 0 && errno == EPERM) ::kill(pid, SIGTERM);
    if (!wait_exit(pid, milliseconds(cfg.stop_grace_ms))) {
        log_warn(fmt::format("proxy pid {} ignored SIGTERM; sending SIGKILL", pid));
        if (::killpg(pid, SIGKILL) != 0) ::kill(pid, SIGKILL);
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
    }
    remove_file(handle.pid_file);
    handle.pid = -1;
}
}
