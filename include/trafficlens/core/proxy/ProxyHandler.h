#pragma once
#include <memory>
#include "trafficlens/core/proxy/Config.h"
#include "trafficlens/core/proxy/CapturePolicy.h"
#include "trafficlens/core/proxy/CaptureStore.h"
#include "trafficlens/core/tls/CertificateAuthority.h"
#include "trafficlens/core/tls/OpenSsl.h"

namespace trafficlens::core::proxy {
// State shared by every client session of one server: configuration,
// capture admission, the store and the TLS material.
class ProxyHandler {
public:
    // ca may be null; CONNECT requests are then always tunneled.
    ProxyHandler(const Config& cfg, CaptureStore& store, std::shared_ptr<tls::CertificateAuthority> ca);
    ProxyHandler(const ProxyHandler&) = delete;
    ProxyHandler& operator=(const ProxyHandler&) = delete;

    const Config& config() const { return cfg; }
    const CapturePolicy& policy() const { return capturePolicy; }
    CaptureStore& store() { return captures; }
    tls::CertificateAuthority* ca() const { return authority.get(); }
    bool intercepting() const { return cfg.enableHttps && authority != nullptr; }
    // Client context for every TLS connection to an origin.
    SSL_CTX* upstream_context() const { return upstreamCtx.get(); }

    // CONNECT to `host` is decrypted rather than tunneled.
    bool should_intercept(std::string_view host) const;
    // Stores the capture when its host passes admission.
    void record(CapturedRequest capture);

private:
    Config cfg;
    CapturePolicy capturePolicy;
    CaptureStore& captures;
    std::shared_ptr<tls::CertificateAuthority> authority;
    tls::SslCtxPtr upstreamCtx;
};
}
