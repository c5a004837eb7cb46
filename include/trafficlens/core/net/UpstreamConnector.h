#pragma once
#include <string>
#include <optional>
#include "trafficlens/core/net/Socket.h"

namespace trafficlens::core::net {
class UpstreamConnector {
public:
    // Resolves host and connects with a bounded wait. On failure `error`
    // receives a human readable reason.
    static std::optional<Socket> connect(const std::string& host, uint16_t port, int timeout_ms = 10000, std::string* error = nullptr);
};
}
