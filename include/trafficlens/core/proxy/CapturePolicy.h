#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace trafficlens::core::proxy {
// "*.example.com" matches any host ending in ".example.com" (not the apex);
// "*example.com" matches the apex too. Anything else is an exact match.
// Comparison is case-insensitive.
bool match_host(std::string_view host, std::string_view pattern);

// Decides which hosts are recorded and which response bodies are buffered.
class CapturePolicy {
public:
    CapturePolicy() = default;
    CapturePolicy(std::vector<std::string> include, std::vector<std::string> exclude, std::vector<std::string> excludedContentTypes)
        : includeHosts(std::move(include)), excludeHosts(std::move(exclude)), excludedTypes(std::move(excludedContentTypes)) {}

    // Port is ignored. Exclusions win over inclusions; an empty include list admits every host.
    bool should_capture(std::string_view host) const;
    // Case-insensitive prefix match of the Content-Type against the exclusion list.
    bool should_exclude_content_type(std::string_view contentType) const;

    const std::vector<std::string>& include_hosts() const { return includeHosts; }
    const std::vector<std::string>& exclude_hosts() const { return excludeHosts; }
    const std::vector<std::string>& excluded_content_types() const { return excludedTypes; }

private:
    std::vector<std::string> includeHosts;
    std::vector<std::string> excludeHosts;
    std::vector<std::string> excludedTypes;
};
}
