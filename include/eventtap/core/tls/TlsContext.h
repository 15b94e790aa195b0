#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

namespace eventtap::core::tls {
struct CertConfig {
    std::string caCertPath;   // path to root CA certificate (PEM)
    std::string caKeyPath;    // path to root CA private key (PEM)
    bool generateIfMissing{true};
};

// Root CA plus per-host leaf certificates for TLS interception.
class TlsContext {
public:
    static std::shared_ptr<TlsContext> create(const CertConfig& cfg);
    ~TlsContext();
    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    const CertConfig& config() const { return cfg_; }
    SSL_CTX* client_ssl_ctx() const { return clientCtx_; }
    bool has_ca() const { return init_ok_ && caCert_ && caKey_; }
    // Returns PEM string of root CA certificate (empty if unavailable)
    std::string export_ca_pem() const;
    // Returns DER (binary) of root CA certificate
    std::string export_ca_der() const;
    // Returns SHA-256 fingerprint (hex, colon separated) of root CA cert (empty if unavailable)
    std::string ca_fingerprint_sha256() const;

    // Cached per hostname; owned by the context.
    struct LeafCertKey { X509* cert{nullptr}; EVP_PKEY* pkey{nullptr}; };
    LeafCertKey get_or_create_leaf(const std::string& hostname);
    // New server-side SSL_CTX presenting the leaf for hostname, ALPN http/1.1 only.
    // Caller frees with SSL_CTX_free. nullptr on failure.
    SSL_CTX* make_server_ctx(const std::string& hostname);

private:
    explicit TlsContext(CertConfig cfg) : cfg_(std::move(cfg)) {}
    CertConfig cfg_;
    bool init_ok_{false};
    X509* caCert_{nullptr};
    EVP_PKEY* caKey_{nullptr};
    SSL_CTX* clientCtx_{nullptr};
    std::mutex leafMu_;
    std::unordered_map<std::string, LeafCertKey> leafCache_;
    long nextSerial_{2};
    LeafCertKey generate_leaf(const std::string& hostname);
};
}
