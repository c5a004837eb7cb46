#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include "trafficlens/core/net/Stream.h"

namespace trafficlens::core::net {
struct Endpoint {
    std::string host;
    uint16_t port{0};
    std::string to_string() const;
};

// Splits "host:port", "[v6]:port", ":port" or a bare host. Missing port yields `default_port`.
std::optional<Endpoint> parse_endpoint(std::string_view text, uint16_t default_port);

class Socket : public Stream {
public:
    Socket();
    explicit Socket(int fd);
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;
    ~Socket() override;
    bool valid() const;
    int native() const;
    void close();
    // Wakes any thread blocked on this socket without releasing the descriptor.
    void shutdown();
    bool set_timeouts(int read_ms, int write_ms);
    // true when readable (or closed by the peer) within timeout_ms.
    bool wait_readable(int timeout_ms) const override;
    std::optional<int> recv_some(std::vector<char>& buffer) override;
    bool send_all(std::string_view data) override;
private:
    int handle{-1};
};

class Listener {
public:
    Listener();
    ~Listener();
    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;
    // Empty host binds all interfaces; port 0 requests an ephemeral port.
    bool open(const std::string& host, uint16_t port, std::string* error = nullptr);
    // Waits up to timeout_ms for a connection; invalid Socket on timeout.
    Socket accept(int timeout_ms, Endpoint* peer = nullptr);
    void close();
    bool valid() const;
    std::optional<Endpoint> local_endpoint() const;
private:
    int handle{-1};
};
}
