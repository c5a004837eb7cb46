#include "trafficlens/core/http/HostUtil.h"
#include "trafficlens/core/http/Headers.h"
#include <arpa/inet.h>
#include <charconv>

namespace trafficlens::core::http {
namespace {
bool split_authority(std::string_view authority, uint16_t default_port, std::string& host, uint16_t& port) {
    port = default_port;
    std::string_view port_part;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) return false;
        host = std::string(authority.substr(1, close - 1));
        auto rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') return false;
            port_part = rest.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos && authority.find(':') == colon) {
            host = std::string(authority.substr(0, colon));
            port_part = authority.substr(colon + 1);
        } else {
            host = std::string(authority);
        }
    }
    if (!port_part.empty()) {
        unsigned p = 0;
        auto [ptr, ec] = std::from_chars(port_part.data(), port_part.data() + port_part.size(), p);
        if (ec != std::errc() || ptr != port_part.data() + port_part.size() || p == 0 || p > 65535) return false;
        port = static_cast<uint16_t>(p);
    }
    return !host.empty();
}
}

std::string HostTarget::url() const {
    return scheme + "://" + authority + path;
}

std::string HostTarget::path_only() const {
    auto end = path.find_first_of("?#");
    return end == std::string::npos ? path : path.substr(0, end);
}

std::optional<HostTarget> parse_absolute_url(std::string_view url) {
    auto sep = url.find("://");
    if (sep == std::string_view::npos) return std::nullopt;
    HostTarget t;
    t.scheme = to_lower(url.substr(0, sep));
    uint16_t default_port;
    if (t.scheme == "http") default_port = 80;
    else if (t.scheme == "https") default_port = 443;
    else return std::nullopt;
    auto rest = url.substr(sep + 3);
    auto slash = rest.find_first_of("/?#");
    auto authority = rest.substr(0, slash);
    // userinfo is never forwarded
    if (auto at = authority.rfind('@'); at != std::string_view::npos) authority.remove_prefix(at + 1);
    if (!split_authority(authority, default_port, t.host, t.port)) return std::nullopt;
    t.authority = std::string(authority);
    if (slash == std::string_view::npos) {
        t.path = "/";
    } else {
        t.path = std::string(rest.substr(slash));
        if (t.path.front() != '/') t.path.insert(t.path.begin(), '/');
    }
    return t;
}

std::optional<HostTarget> extract_host_target(const HttpRequest& req, std::string_view default_scheme) {
    const std::string& target = req.request_line.target;
    if (istarts_with(target, "http://") || istarts_with(target, "https://")) {
        return parse_absolute_url(target);
    }
    auto host_header = find_header(req.headers, "Host");
    if (!host_header || host_header->empty()) return std::nullopt;
    HostTarget t;
    t.scheme = std::string(default_scheme);
    uint16_t default_port = t.scheme == "https" ? 443 : 80;
    if (!split_authority(*host_header, default_port, t.host, t.port)) return std::nullopt;
    t.authority = *host_header;
    t.path = target.empty() || target.front() != '/' ? "/" + target : target;
    return t;
}

std::string strip_port(std::string_view host) {
    std::string h; uint16_t p = 0;
    if (split_authority(host, 0, h, p)) return h;
    return std::string(host);
}

bool is_ip_literal(std::string_view host) {
    std::string h(host);
    unsigned char buf[16];
    return inet_pton(AF_INET, h.c_str(), buf) == 1 || inet_pton(AF_INET6, h.c_str(), buf) == 1;
}
}
