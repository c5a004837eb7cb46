#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace trafficlens::core::proxy {
struct Config {
    std::string listenAddr{":8080"};      // host part optional, port 0 picks an ephemeral port
    bool enableHttps{true};               // intercept CONNECT and terminate TLS
    std::string caCertPath;               // root CA certificate (PEM)
    std::string caKeyPath;                // root CA private key (PEM)
    bool autoGenerateCa{true};            // generate the CA when it cannot be loaded
    std::size_t maxBodySize{10 * 1024 * 1024};  // per-body capture limit
    std::size_t bufferSize{1000};         // capture ring capacity
    std::vector<std::string> includeHosts;
    std::vector<std::string> excludeHosts;
    std::vector<std::string> excludeContentTypes{"image/", "video/", "audio/", "font/"};
    std::string upstreamCaFile;           // extra trust anchors for upstream TLS
    bool verbose{false};

    // Defaults with CA files under the user configuration directory.
    static Config defaults();
    // $XDG_CONFIG_HOME/trafficlens/proxy, else $HOME/.config/trafficlens/proxy, else ./trafficlens/proxy
    static std::string default_ca_dir();

    Config& with_listen_addr(std::string addr) { listenAddr = std::move(addr); return *this; }
    Config& with_https(bool enabled) { enableHttps = enabled; return *this; }
    Config& with_ca_paths(std::string cert, std::string key) { caCertPath = std::move(cert); caKeyPath = std::move(key); return *this; }
    Config& with_auto_generate_ca(bool enabled) { autoGenerateCa = enabled; return *this; }
    Config& with_max_body_size(std::size_t bytes) { maxBodySize = bytes; return *this; }
    Config& with_buffer_size(std::size_t captures) { bufferSize = captures; return *this; }
    Config& with_include_hosts(std::vector<std::string> hosts) { includeHosts = std::move(hosts); return *this; }
    Config& with_exclude_hosts(std::vector<std::string> hosts) { excludeHosts = std::move(hosts); return *this; }
    Config& with_exclude_content_types(std::vector<std::string> types) { excludeContentTypes = std::move(types); return *this; }
    Config& with_upstream_ca_file(std::string path) { upstreamCaFile = std::move(path); return *this; }
    Config& with_verbose(bool enabled) { verbose = enabled; return *this; }
};
}
