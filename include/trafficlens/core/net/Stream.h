#pragma once
#include <optional>
#include <string_view>
#include <vector>

namespace trafficlens::core::net {
// Bidirectional byte stream: a plain socket or a TLS session over one.
class Stream {
public:
    virtual ~Stream() = default;
    // Reads at most buffer.size() bytes; nullopt on EOF, timeout or error.
    virtual std::optional<int> recv_some(std::vector<char>& buffer) = 0;
    virtual bool send_all(std::string_view data) = 0;
    // true when data (or EOF) is available within timeout_ms.
    virtual bool wait_readable(int timeout_ms) const = 0;
};
}
