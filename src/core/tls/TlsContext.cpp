#include "eventtap/core/tls/TlsContext.h"
#include "eventtap/core/util/Logger.h"
#include <fmt/format.h>
#include <filesystem>
#include <cstdio>
#include <cstring>
#include <openssl/x509v3.h>
#include <openssl/rsa.h>
#include <openssl/err.h>

namespace eventtap::core::tls {
using util::log_error;
using util::log_info;
using util::log_warn;

namespace {
EVP_PKEY* generate_rsa_key(int bits) {
    EVP_PKEY* pkey = nullptr;
    EVP_PKEY_CTX* kctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    if (!kctx) return nullptr;
    if (EVP_PKEY_keygen_init(kctx) <= 0 || EVP_PKEY_CTX_set_rsa_keygen_bits(kctx, bits) <= 0 || EVP_PKEY_keygen(kctx, &pkey) <= 0) {
        pkey = nullptr;
    }
    EVP_PKEY_CTX_free(kctx);
    return pkey;
}

void add_ext(X509* cert, X509* issuer, int nid, const char* value) {
    X509V3_CTX v3;
    X509V3_set_ctx_nodb(&v3);
    X509V3_set_ctx(&v3, issuer, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &v3, nid, value);
    if (ext) { X509_add_ext(cert, ext, -1); X509_EXTENSION_free(ext); }
}

bool is_ip_literal(const std::string& host) {
    if (host.find(':') != std::string::npos) return true;
    for (char c : host) if (!((c >= '0' && c <= '9') || c == '.')) return false;
    return !host.empty();
}

int select_http11(SSL*, const unsigned char** out, unsigned char* outlen, const unsigned char* in, unsigned int inlen, void*) {
    unsigned int i = 0;
    while (i + 1 <= inlen) {
        unsigned int l = in[i];
        if (i + 1 + l > inlen) break;
        const unsigned char* proto = &in[i + 1];
        if (l == 8 && std::memcmp(proto, "http/1.1", 8) == 0) { *out = proto; *outlen = static_cast<unsigned char>(l); return SSL_TLSEXT_ERR_OK; }
        i += 1 + l;
    }
    return SSL_TLSEXT_ERR_NOACK;
}
}

std::shared_ptr<TlsContext> TlsContext::create(const CertConfig& cfg){
    auto ctx = std::shared_ptr<TlsContext>(new TlsContext(cfg));
    OPENSSL_init_ssl(0, nullptr);

    std::string caCertPath = cfg.caCertPath.empty() ? "eventtap_root_ca.pem" : cfg.caCertPath;
    std::string caKeyPath  = cfg.caKeyPath.empty()  ? "eventtap_root_ca.key" : cfg.caKeyPath;
    ctx->cfg_.caCertPath = caCertPath;
    ctx->cfg_.caKeyPath = caKeyPath;

    bool haveCert = std::filesystem::exists(caCertPath);
    bool haveKey  = std::filesystem::exists(caKeyPath);

    if (!haveCert || !haveKey) {
        if (!cfg.generateIfMissing) {
            log_warn(fmt::format("root CA missing (cert={} key={}) and generation disabled", caCertPath, caKeyPath));
            return ctx;
        }
        log_info(fmt::format("generating new root CA (cert={} key={})", caCertPath, caKeyPath));
        EVP_PKEY* pkey = generate_rsa_key(2048);
        if (!pkey) { log_error("root CA key generation failed"); return ctx; }
        X509* cert = X509_new();
        ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
        X509_gmtime_adj(X509_get_notBefore(cert), -3600);
        X509_gmtime_adj(X509_get_notAfter(cert), 315360000L); // ~10 years
        X509_set_version(cert, 2);
        X509_set_pubkey(cert, pkey);
        X509_NAME* name = X509_get_subject_name(cert);
        X509_NAME_add_entry_by_txt(name, "C", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("XX"), -1, -1, 0);
        X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("eventtap"), -1, -1, 0);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("eventtap Root CA"), -1, -1, 0);
        X509_set_issuer_name(cert, name);
        add_ext(cert, cert, NID_basic_constraints, "critical,CA:TRUE");
        add_ext(cert, cert, NID_key_usage, "critical,keyCertSign,cRLSign");
        add_ext(cert, cert, NID_subject_key_identifier, "hash");
        if (!X509_sign(cert, pkey, EVP_sha256())) {
            log_error("root CA self-signing failed");
            X509_free(cert); EVP_PKEY_free(pkey);
            return ctx;
        }
        ctx->caCert_ = cert; ctx->caKey_ = pkey; ctx->init_ok_ = true;
        std::error_code ec;
        auto parent = std::filesystem::path(caCertPath).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
        parent = std::filesystem::path(caKeyPath).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
        if (FILE* f = std::fopen(caCertPath.c_str(), "wb")) { PEM_write_X509(f, cert); std::fclose(f); }
        else log_warn(fmt::format("cannot persist root CA certificate to {}", caCertPath));
        if (FILE* f = std::fopen(caKeyPath.c_str(), "wb")) { PEM_write_PrivateKey(f, pkey, nullptr, nullptr, 0, nullptr, nullptr); std::fclose(f); }
        else log_warn(fmt::format("cannot persist root CA key to {}", caKeyPath));
    } else {
        log_info(fmt::format("loading existing root CA (cert={} key={})", caCertPath, caKeyPath));
        if (FILE* fcert = std::fopen(caCertPath.c_str(), "rb")) { ctx->caCert_ = PEM_read_X509(fcert, nullptr, nullptr, nullptr); std::fclose(fcert); }
        if (FILE* fkey = std::fopen(caKeyPath.c_str(), "rb")) { ctx->caKey_ = PEM_read_PrivateKey(fkey, nullptr, nullptr, nullptr); std::fclose(fkey); }
        if (ctx->caCert_ && ctx->caKey_ && X509_check_private_key(ctx->caCert_, ctx->caKey_) == 1) ctx->init_ok_ = true;
        else log_error(fmt::format("root CA at {} / {} could not be loaded", caCertPath, caKeyPath));
    }
    if (ctx->init_ok_) {
        ctx->clientCtx_ = SSL_CTX_new(TLS_client_method());
        if (ctx->clientCtx_) {
            SSL_CTX_set_min_proto_version(ctx->clientCtx_, TLS1_2_VERSION);
            // offer http/1.1 to origins as well, so both sides speak the same protocol
            static const unsigned char alpn[] = { 8, 'h','t','t','p','/','1','.','1' };
            SSL_CTX_set_alpn_protos(ctx->clientCtx_, alpn, sizeof(alpn));
        }
        log_info(fmt::format("CA SHA256 fingerprint {}", ctx->ca_fingerprint_sha256()));
    }
    return ctx;
}

TlsContext::~TlsContext() {
    for (auto& [host, leaf] : leafCache_) {
        if (leaf.cert) X509_free(leaf.cert);
        if (leaf.pkey) EVP_PKEY_free(leaf.pkey);
    }
    if (clientCtx_) SSL_CTX_free(clientCtx_);
    if (caCert_) X509_free(caCert_);
    if (caKey_) EVP_PKEY_free(caKey_);
}

TlsContext::LeafCertKey TlsContext::generate_leaf(const std::string& hostname) {
    LeafCertKey out{};
    if (!has_ca()) return out;
    EVP_PKEY* pkey = generate_rsa_key(2048);
    if (!pkey) return out;
    X509* cert = X509_new();
    ASN1_INTEGER_set(X509_get_serialNumber(cert), nextSerial_++);
    X509_gmtime_adj(X509_get_notBefore(cert), -3600);
    X509_gmtime_adj(X509_get_notAfter(cert), 31536000L); // 1 year
    X509_set_version(cert, 2);
    X509_set_pubkey(cert, pkey);
    X509_NAME* subj = X509_get_subject_name(cert);
    X509_NAME_add_entry_by_txt(subj, "O", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("eventtap"), -1, -1, 0);
    X509_NAME_add_entry_by_txt(subj, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>(hostname.c_str()), -1, -1, 0);
    X509_set_issuer_name(cert, X509_get_subject_name(caCert_));
    std::string san = (is_ip_literal(hostname) ? "IP:" : "DNS:") + hostname;
    add_ext(cert, caCert_, NID_subject_alt_name, san.c_str());
    add_ext(cert, caCert_, NID_ext_key_usage, "serverAuth");
    add_ext(cert, caCert_, NID_basic_constraints, "CA:FALSE");
    add_ext(cert, caCert_, NID_key_usage, "digitalSignature,keyEncipherment");
    add_ext(cert, caCert_, NID_authority_key_identifier, "keyid:always");
    if (!X509_sign(cert, caKey_, EVP_sha256())) {
        X509_free(cert); EVP_PKEY_free(pkey);
        return out;
    }
    out.cert = cert; out.pkey = pkey; return out;
}

TlsContext::LeafCertKey TlsContext::get_or_create_leaf(const std::string& hostname) {
    std::lock_guard lock(leafMu_);
    auto it = leafCache_.find(hostname);
    if (it != leafCache_.end()) return it->second;
    auto leaf = generate_leaf(hostname);
    if (leaf.cert) leafCache_[hostname] = leaf;
    return leaf;
}

SSL_CTX* TlsContext::make_server_ctx(const std::string& hostname) {
    auto leaf = get_or_create_leaf(hostname);
    if (!leaf.cert || !leaf.pkey) return nullptr;
    SSL_CTX* ctx = SSL_CTX_new(TLS_server_method());
    if (!ctx) return nullptr;
    SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
    SSL_CTX_set_alpn_select_cb(ctx, select_http11, nullptr);
    if (SSL_CTX_use_certificate(ctx, leaf.cert) != 1 || SSL_CTX_use_PrivateKey(ctx, leaf.pkey) != 1 || SSL_CTX_check_private_key(ctx) != 1) {
        log_error(fmt::format("leaf certificate for {} rejected by OpenSSL", hostname));
        SSL_CTX_free(ctx);
        return nullptr;
    }
    // chain the root so clients that only pinned it still build a path
    X509* chain = X509_dup(caCert_);
    if (chain && SSL_CTX_add_extra_chain_cert(ctx, chain) != 1) X509_free(chain);
    return ctx;
}

std::string TlsContext::export_ca_pem() const {
    std::string out;
    if (!caCert_) return out;
    BIO* mem = BIO_new(BIO_s_mem());
    if (PEM_write_bio_X509(mem, caCert_)) {
        char* data = nullptr; long len = BIO_get_mem_data(mem, &data);
        if (len > 0 && data) out.assign(data, (size_t)len);
    }
    BIO_free(mem);
    return out;
}

std::string TlsContext::export_ca_der() const {
    std::string out; if(!caCert_) return out; unsigned char* buf=nullptr; int len = i2d_X509(caCert_, &buf); if(len>0 && buf){ out.assign(reinterpret_cast<char*>(buf), (size_t)len); OPENSSL_free(buf);} return out;
}

std::string TlsContext::ca_fingerprint_sha256() const {
    if(!caCert_) return {};
    unsigned char md[EVP_MAX_MD_SIZE]; unsigned int n=0;
    if(!X509_digest(caCert_, EVP_sha256(), md, &n)) return {};
    std::string out; out.reserve(n*3);
    static const char* hex = "0123456789ABCDEF";
    for(unsigned i=0;i<n;++i){ unsigned char b=md[i]; out.push_back(hex[b>>4]); out.push_back(hex[b&0xF]); if(i+1<n) out.push_back(':'); }
    return out;
}
}
