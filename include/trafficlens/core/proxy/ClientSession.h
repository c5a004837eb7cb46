#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include "trafficlens/core/net/Socket.h"
#include "trafficlens/core/http/HttpParser.h"
#include "trafficlens/core/http/HostUtil.h"
#include "trafficlens/core/http/MessageReader.h"
#include "trafficlens/core/proxy/ProxyHandler.h"

namespace trafficlens::core::tls { class TlsStream; }

namespace trafficlens::core::proxy {
constexpr int kClientTimeoutMs = 60 * 1000;
constexpr int kIdleTimeoutMs = 120 * 1000;
constexpr int kUpstreamTimeoutMs = 30 * 1000;
constexpr int kTunnelDialTimeoutMs = 10 * 1000;

// One accepted client connection. Serves keep-alive requests sequentially
// until the client leaves, an error occurs or the session is aborted.
class ClientSession : public std::enable_shared_from_this<ClientSession> {
public:
    ClientSession(net::Socket socket, net::Endpoint peer, ProxyHandler& handler);
    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    // Runs the session on the calling thread. Never throws.
    void start();
    // Wakes the session out of any blocking read on the client or upstream leg.
    void abort();
    // Waiting for the next request head rather than serving one.
    bool idle() const { return waiting.load(); }
    // Finish the current exchange, then close instead of reading another request.
    void finish_after_current() { closing.store(true); }
    const net::Endpoint& peer() const { return clientPeer; }

private:
    // TLS leg details of an intercepted CONNECT.
    struct SecureLeg {
        std::string authority;  // CONNECT target, host:port
        std::string host;
        uint16_t port{443};
        tls::TlsStream* client{nullptr};
    };

    void process();
    void serve(http::MessageReader& reader, net::Stream& stream, const SecureLeg* leg);
    // Returns true when the client connection may carry another request.
    bool exchange(http::HttpRequest& req, http::MessageReader& reader, net::Stream& stream, const SecureLeg* leg);
    void handle_connect(const http::HttpRequest& req, http::MessageReader& reader);
    void tunnel(const std::string& host, uint16_t port, std::string buffered);
    void intercept(const std::string& authority, const std::string& host, uint16_t port);

    void attach_upstream(net::Socket* upstream);
    static void send_simple(net::Stream& stream, int code, const std::string& body, bool close = true);

    net::Socket client;
    net::Endpoint clientPeer;
    ProxyHandler& handler;
    std::atomic<bool> waiting{false};
    std::atomic<bool> closing{false};
    std::mutex legMu;  // guards shutdown of the sockets against abort()
    net::Socket* upstreamLeg{nullptr};
    bool aborted{false};
};
}
