#include "eventtap/core/server/ServerConfig.h"
#include "eventtap/core/util/Env.h"
#include "eventtap/core/util/Logger.h"
#include <fmt/format.h>

namespace eventtap::core::server {
using util::env_int;
using util::env_string;

ServerConfig ServerConfig::from_env() {
    ServerConfig cfg;
    cfg.host = env_string("EVENTTAP_SERVER_HOST", cfg.host);
    auto port = env_int("EVENTTAP_SERVER_PORT", cfg.port);
    if (port < 0 || port > 65535) {
        util::log_warn(fmt::format("EVENTTAP_SERVER_PORT out of range ({}), using {}", port, cfg.port));
    } else {
        cfg.port = static_cast<uint16_t>(port);
    }
    auto workers = env_int("EVENTTAP_SERVER_WORKERS", cfg.worker_threads);
    if (workers > 0 && workers <= 256) cfg.worker_threads = static_cast<unsigned>(workers);
    return cfg;
}
}
