#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/evp.h>

namespace trafficlens::core::tls {
struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
struct EvpPkeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct SslCtxDeleter { void operator()(SSL_CTX* p) const { SSL_CTX_free(p); } };
struct SslDeleter { void operator()(SSL* p) const { SSL_free(p); } };
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
using SslPtr = std::unique_ptr<SSL, SslDeleter>;

class TlsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Drains this thread's OpenSSL error queue into one line. Returns `fallback`
// when the queue is empty.
std::string openssl_error(const std::string& fallback = "unknown TLS error");
}
