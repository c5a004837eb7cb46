#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "trafficlens/core/net/Socket.h"
#include "trafficlens/core/tls/OpenSsl.h"

namespace trafficlens::core::tls {
// Builds the context used for upstream connections: peer verification against
// the system trust store plus `extra_ca_file` when non-empty.
SslCtxPtr make_client_context(const std::string& extra_ca_file = {});

// TLS session over a borrowed socket. The socket must outlive the stream.
class TlsStream : public net::Stream {
public:
    ~TlsStream() override;
    TlsStream(const TlsStream&) = delete;
    TlsStream& operator=(const TlsStream&) = delete;

    // Server-side handshake presenting the certificate installed in ctx.
    static std::unique_ptr<TlsStream> accept(net::Socket& sock, SSL_CTX* ctx, std::string* error = nullptr);
    // Client-side handshake with SNI and hostname (or IP) verification.
    static std::unique_ptr<TlsStream> connect(net::Socket& sock, SSL_CTX* ctx, const std::string& host, std::string* error = nullptr);

    std::optional<int> recv_some(std::vector<char>& buffer) override;
    bool send_all(std::string_view data) override;
    bool wait_readable(int timeout_ms) const override;
    // Sends close_notify; the socket stays open.
    void shutdown();
    std::string version() const;
    std::string cipher() const;

private:
    TlsStream(net::Socket& sock, SslPtr ssl);
    net::Socket& socket;
    SslPtr ssl;
    bool closed{false};
};
}
