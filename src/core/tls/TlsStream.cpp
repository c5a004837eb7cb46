#include "trafficlens/core/tls/TlsStream.h"
#include "trafficlens/core/http/HostUtil.h"
#include "trafficlens/core/util/Logger.h"
#include <climits>
#include <openssl/err.h>
#include <openssl/x509v3.h>

namespace trafficlens::core::tls {
using util::log_warn;

namespace {
std::string handshake_error(SSL* ssl, int rc, const std::string& what) {
    int err = SSL_get_error(ssl, rc);
    std::string detail = openssl_error("");
    if (err == SSL_ERROR_SSL) {
        long vr = SSL_get_verify_result(ssl);
        if (vr != X509_V_OK) detail = std::string("certificate verify failed: ") + X509_verify_cert_error_string(vr);
    }
    if (detail.empty()) detail = (err == SSL_ERROR_SYSCALL || err == SSL_ERROR_ZERO_RETURN) ? "connection closed" : "ssl_err=" + std::to_string(err);
    return what + ": " + detail;
}
}

SslCtxPtr make_client_context(const std::string& extra_ca_file) {
    SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
    if (!ctx) throw TlsError("SSL_CTX_new failed: " + openssl_error());
    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
    SSL_CTX_set_mode(ctx.get(), SSL_MODE_AUTO_RETRY);
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
    if (SSL_CTX_set_default_verify_paths(ctx.get()) != 1) {
        log_warn("could not load system trust store: {}", openssl_error());
    }
    if (!extra_ca_file.empty() && SSL_CTX_load_verify_locations(ctx.get(), extra_ca_file.c_str(), nullptr) != 1) {
        throw TlsError("failed to load upstream CA file " + extra_ca_file + ": " + openssl_error());
    }
    static const unsigned char alpn[] = { 8, 'h', 't', 't', 'p', '/', '1', '.', '1' };
    SSL_CTX_set_alpn_protos(ctx.get(), alpn, sizeof(alpn));
    return ctx;
}

TlsStream::TlsStream(net::Socket& sock, SslPtr s) : socket(sock), ssl(std::move(s)) {}

TlsStream::~TlsStream() = default;

std::unique_ptr<TlsStream> TlsStream::accept(net::Socket& sock, SSL_CTX* ctx, std::string* error) {
    ERR_clear_error();
    SslPtr ssl(SSL_new(ctx));
    if (!ssl || SSL_set_fd(ssl.get(), sock.native()) != 1) {
        if (error) *error = "SSL_new failed: " + openssl_error();
        return nullptr;
    }
    int rc = SSL_accept(ssl.get());
    if (rc != 1) {
        if (error) *error = handshake_error(ssl.get(), rc, "client handshake failed");
        return nullptr;
    }
    return std::unique_ptr<TlsStream>(new TlsStream(sock, std::move(ssl)));
}

std::unique_ptr<TlsStream> TlsStream::connect(net::Socket& sock, SSL_CTX* ctx, const std::string& host, std::string* error) {
    ERR_clear_error();
    SslPtr ssl(SSL_new(ctx));
    if (!ssl || SSL_set_fd(ssl.get(), sock.native()) != 1) {
        if (error) *error = "SSL_new failed: " + openssl_error();
        return nullptr;
    }
    if (http::is_ip_literal(host)) {
        X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl.get()), host.c_str());
    } else {
        SSL_set_tlsext_host_name(ssl.get(), host.c_str());
        SSL_set1_host(ssl.get(), host.c_str());
    }
    int rc = SSL_connect(ssl.get());
    if (rc != 1) {
        if (error) *error = handshake_error(ssl.get(), rc, "tls handshake with " + host + " failed");
        return nullptr;
    }
    return std::unique_ptr<TlsStream>(new TlsStream(sock, std::move(ssl)));
}

std::optional<int> TlsStream::recv_some(std::vector<char>& buffer) {
    if (closed || buffer.empty()) return std::nullopt;
    int want = buffer.size() > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(buffer.size());
    int n = SSL_read(ssl.get(), buffer.data(), want);
    if (n <= 0) {
        int err = SSL_get_error(ssl.get(), n);
        if (err == SSL_ERROR_ZERO_RETURN) closed = true;
        ERR_clear_error();
        return std::nullopt;
    }
    return n;
}

bool TlsStream::send_all(std::string_view data) {
    size_t sent = 0;
    while (sent < data.size()) {
        size_t left = data.size() - sent;
        int chunk = left > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(left);
        int n = SSL_write(ssl.get(), data.data() + sent, chunk);
        if (n <= 0) { ERR_clear_error(); return false; }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool TlsStream::wait_readable(int timeout_ms) const {
    if (SSL_pending(ssl.get()) > 0) return true;
    return socket.wait_readable(timeout_ms);
}

void TlsStream::shutdown() {
    if (!ssl) return;
    SSL_shutdown(ssl.get());
    ERR_clear_error();
}

std::string TlsStream::version() const { return SSL_get_version(ssl.get()); }

std::string TlsStream::cipher() const {
    const char* name = SSL_get_cipher_name(ssl.get());
    return name ? name : "";
}
}
