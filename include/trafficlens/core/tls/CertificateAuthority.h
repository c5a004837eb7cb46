#pragma once
#include <string>
#include <string_view>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include "trafficlens/core/tls/OpenSsl.h"

namespace trafficlens::core::tls {
struct CertConfig {
    std::string caCertPath;   // path to root CA certificate (PEM)
    std::string caKeyPath;    // path to root CA private key (PEM)
    bool generateIfMissing{true};
};

// Certificate impersonating one origin host, ready to terminate TLS.
struct LeafCertificate {
    std::string hostname;
    X509Ptr cert;
    EvpPkeyPtr key;
    std::vector<X509Ptr> chain;  // issuer certificates, CA last
    SslCtxPtr serverCtx;         // presents cert + chain
};

// Owns the proxy's root CA and mints per-host leaf certificates signed by it.
class CertificateAuthority {
public:
    CertificateAuthority() = default;
    CertificateAuthority(const CertificateAuthority&) = delete;
    CertificateAuthority& operator=(const CertificateAuthority&) = delete;

    // Loads the CA from cfg, generating it when loading fails and
    // cfg.generateIfMissing is set. Throws TlsError otherwise.
    static std::shared_ptr<CertificateAuthority> create(const CertConfig& cfg);

    void load(const std::string& certPath, const std::string& keyPath);
    void generate(const std::string& certPath, const std::string& keyPath);
    bool has_ca() const { return caCert_ && caKey_; }

    // Host may carry a port, which is ignored. Throws TlsError when issuance fails.
    std::shared_ptr<const LeafCertificate> cert_for_host(std::string_view host);
    bool verify_leaf(const LeafCertificate& leaf) const;
    std::size_t cached_leaf_count() const;

    std::string ca_cert_pem() const;
    std::string ca_cert_der() const;
    std::string ca_fingerprint_sha256() const;
    void export_ca_cert(const std::string& path) const;
    const CertConfig& config() const { return cfg_; }

private:
    std::shared_ptr<LeafCertificate> generate_leaf(const std::string& hostname) const;
    SslCtxPtr make_server_ctx(const LeafCertificate& leaf) const;

    CertConfig cfg_;
    X509Ptr caCert_;
    EvpPkeyPtr caKey_;
    mutable std::shared_mutex cacheMu_;
    std::unordered_map<std::string, std::shared_ptr<const LeafCertificate>> leafCache_;
};
}
