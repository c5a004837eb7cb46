#include "trafficlens/core/proxy/ProxyHandler.h"
#include "trafficlens/core/tls/TlsStream.h"

namespace trafficlens::core::proxy {
ProxyHandler::ProxyHandler(const Config& config, CaptureStore& store, std::shared_ptr<tls::CertificateAuthority> ca)
    : cfg(config),
      capturePolicy(config.includeHosts, config.excludeHosts, config.excludeContentTypes),
      captures(store),
      authority(std::move(ca)) {
    upstreamCtx = tls::make_client_context(cfg.upstreamCaFile);
}

bool ProxyHandler::should_intercept(std::string_view host) const {
    return intercepting() && capturePolicy.should_capture(host);
}

void ProxyHandler::record(CapturedRequest capture) {
    if (!capturePolicy.should_capture(capture.host)) return;
    captures.add(std::move(capture));
}
}
