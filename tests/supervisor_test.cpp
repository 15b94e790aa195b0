#include "eventtap/core/supervisor/ProxySupervisor.h"
#include "eventtap/core/server/IngestionServer.h"
#include "eventtap/core/net/UpstreamConnector.h"
#include "eventtap/core/Error.h"
#include <cassert>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>
#include <signal.h>
#include <unistd.h>

#ifndef EVENTTAP_PROXY_BINARY
#define EVENTTAP_PROXY_BINARY "eventtap_proxy"
#endif

using namespace eventtap::core;
using namespace eventtap::core::supervisor;
namespace fs = std::filesystem;

static uint16_t free_port(){
    net::Listener l;
    bool ok = l.open(0, "127.0.0.1");
    assert(ok);
    auto p = l.bound_port();
    l.close();
    return p;
}

static bool throws_setup_error(ProxySupervisor& sup){
    try {
        auto h = sup.start(proxy::MirrorConfig{}, "http://127.0.0.1:1/event");
        sup.stop(h);
    } catch (const SetupError&) {
        return true;
    }
    return false;
}

int main(){
    auto dir = fs::temp_directory_path() / ("eventtap_supervisor_test_" + std::to_string(::getpid()));

    // argument filtering
    {
        std::vector<std::string> in{ "--port", "8080", "--verbose", "-p", "1", "--listen-host", "0.0.0.0",
                                     "--port=7", "--bind-host=::", "--mitm-allow", "*.example.com" };
        auto out = filter_proxy_args(in);
        std::vector<std::string> expected{ "--verbose", "--mitm-allow", "*.example.com" };
        assert(out == expected);
        assert(filter_proxy_args({}).empty());
    }

    // credential-looking environment names
    {
        assert(is_secret_env("API_KEY"));
        assert(is_secret_env("GITHUB_TOKEN"));
        assert(is_secret_env("AWS_REGION"));
        assert(is_secret_env("db_password"));
        assert(is_secret_env("GOOGLE_APPLICATION_CREDENTIALS"));
        assert(!is_secret_env("PATH"));
        assert(!is_secret_env("HOME"));
        assert(!is_secret_env("EVENTTAP_TARGET_HOST"));
    }

    // binary lookup
    {
        auto sh = resolve_binary("sh");
        assert(sh && fs::path(*sh).filename() == "sh");
        assert(resolve_binary("/bin/sh").has_value());
        assert(!resolve_binary("definitely-not-a-real-binary-eventtap").has_value());
        assert(!resolve_binary("").has_value());
    }

    // refusals
    {
        SupervisorConfig cfg; cfg.proxy_binary = "definitely-not-a-real-binary-eventtap"; cfg.port = free_port(); cfg.log_dir = dir.string();
        ProxySupervisor missing(cfg);
        assert(throws_setup_error(missing));

        net::Listener busy;
        bool ok = busy.open(0, "127.0.0.1");
        assert(ok);
        SupervisorConfig taken; taken.proxy_binary = EVENTTAP_PROXY_BINARY; taken.port = busy.bound_port(); taken.log_dir = dir.string();
        ProxySupervisor clash(taken);
        assert(throws_setup_error(clash));
        busy.close();

        SupervisorConfig quits; quits.proxy_binary = "false"; quits.port = free_port(); quits.log_dir = dir.string(); quits.start_timeout_ms = 3000;
        ProxySupervisor early(quits);
        assert(throws_setup_error(early));

        ProxyHandle idle;
        early.stop(idle);
        assert(!idle.running());
    }

    // full lifecycle against the real proxy binary
    {
        event::EventStore store;
        server::ServerConfig scfg; scfg.port = 0;
        server::IngestionServer collector(store, scfg);
        collector.start();

        SupervisorConfig cfg;
        cfg.proxy_binary = EVENTTAP_PROXY_BINARY;
        cfg.port = free_port();
        cfg.log_dir = dir.string();
        cfg.log_level = "debug";
        cfg.extra_args = { "--port", "1" };
        ProxySupervisor sup(cfg);
        proxy::MirrorConfig target; target.target_host = "127.0.0.1"; target.target_path = "/batch";
        auto handle = sup.start(target, collector.base_url() + "/event");
        assert(handle.running());
        assert(handle.port == cfg.port);
        assert(handle.url() == "http://127.0.0.1:" + std::to_string(cfg.port));
        assert(fs::exists(handle.log_path));
        assert(fs::exists(handle.pid_file));
        assert(sup.is_healthy(handle));

        // traffic through the supervised proxy reaches the collector as a mirror
        auto s = net::UpstreamConnector::connect("127.0.0.1", cfg.port, 2000, 5000);
        assert(s.has_value());
        std::string body = R"([{"name":"from_child"}])";
        std::string authority = "127.0.0.1:" + std::to_string(collector.port());
        bool sent = s->send_all("POST http://" + authority + "/batch HTTP/1.1\r\nHost: " + authority +
                                "\r\nContent-Length: " + std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body);
        assert(sent);
        std::vector<char> buf(4096);
        std::string reply;
        while (auto r = s->recv_some(buf)) reply.append(buf.data(), static_cast<size_t>(*r));
        assert(reply.rfind("HTTP/1.1 404", 0) == 0);
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (store.size() == 0 && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(std::chrono::milliseconds(20));
        assert(store.size() == 1);
        assert(store.snapshot()[0].name == "from_child");

        pid_t pid = handle.pid;
        sup.stop(handle);
        assert(!handle.running());
        assert(::kill(pid, 0) != 0);
        assert(!fs::exists(handle.pid_file));
        assert(!net::UpstreamConnector::is_listening("127.0.0.1", cfg.port));
        assert(!sup.is_healthy(handle));
        sup.stop(handle);
        collector.stop();
    }

    fs::remove_all(dir);
    return 0;
}
