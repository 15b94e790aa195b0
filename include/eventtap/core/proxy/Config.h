#pragma once
#include <cstdint>
#include <cstddef>
#include <string>

namespace eventtap::core::proxy {
struct Config {
    std::string bindHost { "0.0.0.0" };
    int connectTimeoutMs { 3000 };   // upstream TCP connect
    int idleTimeoutMs { 30000 };     // tunnels and keep-alive connections close after this much silence
    std::size_t maxBodyBytes { 64 * 1024 * 1024 };

    // TLS MITM settings
    bool enableTlsMitm { false };    // intercept CONNECT and terminate TLS with a locally signed leaf
    std::string caCertPath;          // root CA certificate (PEM); empty => ~/.eventtap/root_ca.pem
    std::string caKeyPath;           // root CA private key (PEM); empty => ~/.eventtap/root_ca_key.pem
    bool generateCaIfMissing { true };
    bool regenerateCa { false };     // discard the stored root CA and create a new one
    std::string mitmAllowList;       // comma-separated host globs to intercept (empty => all unless denied)
    std::string mitmDenyList;        // comma-separated host globs never intercepted
};
}
