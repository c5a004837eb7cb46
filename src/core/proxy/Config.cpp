#include "trafficlens/core/proxy/Config.h"
#include <cstdlib>
#include <filesystem>

namespace trafficlens::core::proxy {
std::string Config::default_ca_dir() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".config";
    } else {
        base = ".";
    }
    return (base / "trafficlens" / "proxy").string();
}

Config Config::defaults() {
    Config cfg;
    std::filesystem::path dir = default_ca_dir();
    cfg.caCertPath = (dir / "ca.crt").string();
    cfg.caKeyPath = (dir / "ca.key").string();
    return cfg;
}
}
