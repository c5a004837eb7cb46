#include "trafficlens/core/proxy/CapturePolicy.h"
#include "trafficlens/core/http/Headers.h"
#include "trafficlens/core/http/HostUtil.h"

namespace trafficlens::core::proxy {
bool match_host(std::string_view host, std::string_view pattern) {
    if (pattern.empty()) return false;
    if (pattern.front() == '*') {
        auto suffix = pattern.substr(1);
        if (host.size() < suffix.size()) return false;
        return http::iequals(host.substr(host.size() - suffix.size()), suffix);
    }
    return http::iequals(host, pattern);
}

bool CapturePolicy::should_capture(std::string_view host) const {
    auto bare = http::to_lower(http::strip_port(host));
    for (auto& p : excludeHosts) if (match_host(bare, p)) return false;
    if (includeHosts.empty()) return true;
    for (auto& p : includeHosts) if (match_host(bare, p)) return true;
    return false;
}

bool CapturePolicy::should_exclude_content_type(std::string_view contentType) const {
    if (contentType.empty()) return false;
    for (auto& t : excludedTypes) {
        if (!t.empty() && http::istarts_with(contentType, t)) return true;
    }
    return false;
}
}
