#pragma once
#include <string>
#include <cstdint>
#include <cstddef>

namespace eventtap::core::server {
struct ServerConfig {
    std::string host { "127.0.0.1" };
    uint16_t port { 8000 };                         // 0 picks an ephemeral port
    unsigned worker_threads { 4 };                  // connection handlers run on this many threads
    std::size_t max_body_bytes { 8 * 1024 * 1024 }; // larger POST bodies get 413
    int io_timeout_ms { 5000 };                     // per read/write on a connection
    int keep_alive_ms { 5000 };                     // idle time allowed between requests
    std::string name_field { "name" };              // top-level field holding the event name
    std::string name_fallback_path { "event.name" };// dot-separated path tried when name_field is absent
    std::string envelope_field { "events" };        // {"events":[...]} is unpacked into its elements

    // EVENTTAP_SERVER_HOST, EVENTTAP_SERVER_PORT, EVENTTAP_SERVER_WORKERS
    static ServerConfig from_env();
};
}
