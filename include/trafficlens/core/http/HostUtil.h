#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include "trafficlens/core/http/HttpParser.h"

namespace trafficlens::core::http {
struct HostTarget {
    std::string scheme{"http"};
    std::string host;       // without port, brackets removed for IPv6
    uint16_t port{80};
    std::string authority;  // host[:port] exactly as addressed
    std::string path{"/"};  // path and query
    std::string url() const;
    // path without query or fragment
    std::string path_only() const;
};

// Parses "scheme://authority/path?query". Only http and https are accepted.
std::optional<HostTarget> parse_absolute_url(std::string_view url);
// Target of a proxied request: absolute-form target, else Host header + origin-form path.
std::optional<HostTarget> extract_host_target(const HttpRequest& req, std::string_view default_scheme = "http");

// "example.com:8443" -> "example.com", "[::1]:80" -> "::1".
std::string strip_port(std::string_view host);
bool is_ip_literal(std::string_view host);
}
