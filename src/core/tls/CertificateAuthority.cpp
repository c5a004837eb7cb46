#include "trafficlens/core/tls/CertificateAuthority.h"
#include "trafficlens/core/http/HostUtil.h"
#include "trafficlens/core/http/Headers.h"
#include "trafficlens/core/util/Logger.h"
#include <filesystem>
#include <fstream>
#include <mutex>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fmt/format.h>
#include <openssl/x509v3.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/bn.h>
#include <openssl/err.h>

namespace trafficlens::core::tls {
using util::log_info;
using util::log_debug;

std::string openssl_error(const std::string& fallback) {
    std::string out;
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out.empty() ? fallback : out;
}

namespace {
constexpr long kHour = 3600;
constexpr long kCaValidityDays = 3650;
constexpr long kLeafValidityDays = 365;

struct BioDeleter { void operator()(BIO* b) const { BIO_free(b); } };
struct BnDeleter { void operator()(BIGNUM* b) const { BN_free(b); } };
struct PkeyCtxDeleter { void operator()(EVP_PKEY_CTX* c) const { EVP_PKEY_CTX_free(c); } };
struct FileCloser { void operator()(FILE* f) const { std::fclose(f); } };
using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using FilePtr = std::unique_ptr<FILE, FileCloser>;

EvpPkeyPtr generate_rsa_key(int bits) {
    PkeyCtxPtr kctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    EVP_PKEY* raw = nullptr;
    if (!kctx || EVP_PKEY_keygen_init(kctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(kctx.get(), bits) <= 0 ||
        EVP_PKEY_keygen(kctx.get(), &raw) <= 0) {
        throw TlsError("failed to generate RSA key: " + openssl_error());
    }
    return EvpPkeyPtr(raw);
}

void set_random_serial(X509* cert) {
    BnPtr bn(BN_new());
    if (!bn || !BN_rand(bn.get(), 127, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) ||
        !BN_to_ASN1_INTEGER(bn.get(), X509_get_serialNumber(cert))) {
        throw TlsError("failed to generate serial number: " + openssl_error());
    }
}

void set_validity(X509* cert, long days) {
    if (!X509_gmtime_adj(X509_getm_notBefore(cert), -kHour) ||
        !X509_time_adj_ex(X509_getm_notAfter(cert), static_cast<int>(days), 0, nullptr)) {
        throw TlsError("failed to set certificate validity: " + openssl_error());
    }
}

void add_name_entry(X509_NAME* name, const char* field, const std::string& value) {
    if (!X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
            reinterpret_cast<const unsigned char*>(value.c_str()), -1, -1, 0)) {
        throw TlsError(std::string("failed to set subject ") + field + ": " + openssl_error());
    }
}

void add_ext(X509* cert, X509V3_CTX* ctx, int nid, const std::string& value) {
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, ctx, nid, value.c_str());
    if (!ext) throw TlsError("failed to build extension " + value + ": " + openssl_error());
    int ok = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    if (!ok) throw TlsError("failed to add extension " + value + ": " + openssl_error());
}

std::string to_pem(X509* cert) {
    std::string out;
    BioPtr mem(BIO_new(BIO_s_mem()));
    if (mem && PEM_write_bio_X509(mem.get(), cert)) {
        char* data = nullptr; long len = BIO_get_mem_data(mem.get(), &data);
        if (len > 0 && data) out.assign(data, static_cast<size_t>(len));
    }
    return out;
}

void ensure_parent_dir(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (parent.empty() || std::filesystem::exists(parent)) return;
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) throw TlsError("failed to create CA directory " + parent.string() + ": " + ec.message());
    std::filesystem::permissions(parent, std::filesystem::perms::owner_all, ec);
}

FilePtr open_for_write(const std::string& path, mode_t mode) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
    if (fd < 0) throw TlsError("failed to create " + path + ": " + std::strerror(errno));
    // an existing file keeps its old mode through O_CREAT
    ::fchmod(fd, mode);
    FILE* f = ::fdopen(fd, "wb");
    if (!f) { ::close(fd); throw TlsError("failed to open " + path + ": " + std::strerror(errno)); }
    return FilePtr(f);
}
}

std::shared_ptr<CertificateAuthority> CertificateAuthority::create(const CertConfig& cfg) {
    auto ca = std::make_shared<CertificateAuthority>();
    ca->cfg_ = cfg;
    try {
        ca->load(cfg.caCertPath, cfg.caKeyPath);
        log_info("loaded root CA (cert={} key={})", cfg.caCertPath, cfg.caKeyPath);
    } catch (const TlsError& e) {
        if (!cfg.generateIfMissing) throw TlsError(std::string("failed to load CA certificate: ") + e.what());
        log_info("generating new root CA (cert={} key={}): {}", cfg.caCertPath, cfg.caKeyPath, e.what());
        try {
            ca->generate(cfg.caCertPath, cfg.caKeyPath);
        } catch (const TlsError& ge) {
            throw TlsError(std::string("failed to generate CA certificate: ") + ge.what());
        }
    }
    log_info("CA SHA256 fingerprint {}", ca->ca_fingerprint_sha256());
    return ca;
}

void CertificateAuthority::load(const std::string& certPath, const std::string& keyPath) {
    FilePtr fcert(std::fopen(certPath.c_str(), "rb"));
    if (!fcert) throw TlsError("open " + certPath + ": " + std::strerror(errno));
    FilePtr fkey(std::fopen(keyPath.c_str(), "rb"));
    if (!fkey) throw TlsError("open " + keyPath + ": " + std::strerror(errno));
    X509Ptr cert(PEM_read_X509(fcert.get(), nullptr, nullptr, nullptr));
    if (!cert) throw TlsError("failed to decode CA certificate PEM: " + openssl_error());
    // PEM_read_PrivateKey accepts both PKCS#1 and PKCS#8 encodings
    EvpPkeyPtr key(PEM_read_PrivateKey(fkey.get(), nullptr, nullptr, nullptr));
    if (!key) throw TlsError("failed to decode CA key PEM: " + openssl_error());
    if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) throw TlsError("CA key is not RSA");
    if (X509_check_private_key(cert.get(), key.get()) != 1) {
        throw TlsError("CA key does not match certificate: " + openssl_error());
    }
    caCert_ = std::move(cert);
    caKey_ = std::move(key);
    cfg_.caCertPath = certPath;
    cfg_.caKeyPath = keyPath;
}

void CertificateAuthority::generate(const std::string& certPath, const std::string& keyPath) {
    EvpPkeyPtr key = generate_rsa_key(2048);
    X509Ptr cert(X509_new());
    if (!cert) throw TlsError("X509_new failed: " + openssl_error());
    X509_set_version(cert.get(), 2);
    set_random_serial(cert.get());
    set_validity(cert.get(), kCaValidityDays);
    X509_set_pubkey(cert.get(), key.get());
    X509_NAME* name = X509_get_subject_name(cert.get());
    add_name_entry(name, "O", "Trafficlens");
    add_name_entry(name, "CN", "Trafficlens Proxy CA");
    X509_set_issuer_name(cert.get(), name);

    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, cert.get(), cert.get(), nullptr, nullptr, 0);
    add_ext(cert.get(), &ctx, NID_basic_constraints, "critical,CA:TRUE,pathlen:1");
    add_ext(cert.get(), &ctx, NID_key_usage, "critical,keyCertSign,cRLSign,digitalSignature");
    add_ext(cert.get(), &ctx, NID_subject_key_identifier, "hash");
    if (!X509_sign(cert.get(), key.get(), EVP_sha256())) throw TlsError("failed to create CA certificate: " + openssl_error());

    ensure_parent_dir(certPath);
    ensure_parent_dir(keyPath);
    {
        auto f = open_for_write(certPath, 0644);
        if (!PEM_write_X509(f.get(), cert.get())) throw TlsError("failed to write CA certificate: " + openssl_error());
    }
    {
        auto f = open_for_write(keyPath, 0600);
        BioPtr out(BIO_new_fp(f.get(), BIO_NOCLOSE));
        if (!out || !PEM_write_bio_PrivateKey_traditional(out.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr)) {
            throw TlsError("failed to write CA key: " + openssl_error());
        }
    }
    caCert_ = std::move(cert);
    caKey_ = std::move(key);
    cfg_.caCertPath = certPath;
    cfg_.caKeyPath = keyPath;
}

std::shared_ptr<LeafCertificate> CertificateAuthority::generate_leaf(const std::string& hostname) const {
    if (!has_ca()) throw TlsError("no CA certificate loaded");
    auto leaf = std::make_shared<LeafCertificate>();
    leaf->hostname = hostname;
    leaf->key = generate_rsa_key(2048);
    leaf->cert.reset(X509_new());
    X509* cert = leaf->cert.get();
    if (!cert) throw TlsError("X509_new failed: " + openssl_error());
    X509_set_version(cert, 2);
    set_random_serial(cert);
    set_validity(cert, kLeafValidityDays);
    X509_set_pubkey(cert, leaf->key.get());
    // CN is limited to 64 characters; the SAN carries the name regardless
    if (hostname.size() <= 64) add_name_entry(X509_get_subject_name(cert), "CN", hostname);
    X509_set_issuer_name(cert, X509_get_subject_name(caCert_.get()));

    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, caCert_.get(), cert, nullptr, nullptr, 0);
    add_ext(cert, &ctx, NID_basic_constraints, "critical,CA:FALSE");
    add_ext(cert, &ctx, NID_key_usage, "critical,digitalSignature,keyEncipherment");
    add_ext(cert, &ctx, NID_ext_key_usage, "serverAuth");
    add_ext(cert, &ctx, NID_subject_alt_name, (http::is_ip_literal(hostname) ? "IP:" : "DNS:") + hostname);
    add_ext(cert, &ctx, NID_authority_key_identifier, "keyid:always");
    if (!X509_sign(cert, caKey_.get(), EVP_sha256())) throw TlsError("failed to create host certificate: " + openssl_error());

    X509_up_ref(caCert_.get());
    leaf->chain.emplace_back(caCert_.get());
    leaf->serverCtx = make_server_ctx(*leaf);
    return leaf;
}

SslCtxPtr CertificateAuthority::make_server_ctx(const LeafCertificate& leaf) const {
    SslCtxPtr ctx(SSL_CTX_new(TLS_server_method()));
    if (!ctx) throw TlsError("SSL_CTX_new failed: " + openssl_error());
    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
    SSL_CTX_set_mode(ctx.get(), SSL_MODE_AUTO_RETRY);
    if (SSL_CTX_use_certificate(ctx.get(), leaf.cert.get()) != 1 ||
        SSL_CTX_use_PrivateKey(ctx.get(), leaf.key.get()) != 1 ||
        SSL_CTX_check_private_key(ctx.get()) != 1) {
        throw TlsError("failed to install host certificate: " + openssl_error());
    }
    for (auto& issuer : leaf.chain) {
        X509* dup = X509_dup(issuer.get());
        // add_extra_chain_cert takes ownership on success
        if (!dup || SSL_CTX_add_extra_chain_cert(ctx.get(), dup) != 1) {
            X509_free(dup);
            throw TlsError("failed to add chain certificate: " + openssl_error());
        }
    }
    // Only HTTP/1.1 is spoken on the decrypted stream.
    SSL_CTX_set_alpn_select_cb(ctx.get(), [](SSL*, const unsigned char** out, unsigned char* outlen,
                                             const unsigned char* in, unsigned int inlen, void*) -> int {
        unsigned int i = 0;
        while (i < inlen) {
            unsigned int l = in[i];
            if (i + 1 + l > inlen) break;
            const unsigned char* proto = &in[i + 1];
            if (l == 8 && std::memcmp(proto, "http/1.1", 8) == 0) { *out = proto; *outlen = static_cast<unsigned char>(l); return SSL_TLSEXT_ERR_OK; }
            i += 1 + l;
        }
        return SSL_TLSEXT_ERR_NOACK;
    }, nullptr);
    return ctx;
}

std::shared_ptr<const LeafCertificate> CertificateAuthority::cert_for_host(std::string_view host) {
    std::string hostname = http::to_lower(http::strip_port(host));
    if (hostname.empty()) throw TlsError("empty hostname");
    {
        std::shared_lock lock(cacheMu_);
        auto it = leafCache_.find(hostname);
        if (it != leafCache_.end()) return it->second;
    }
    // Generated outside the lock: concurrent first requests for one host may
    // both issue a certificate, the later insert wins. Either is valid.
    std::shared_ptr<const LeafCertificate> leaf = generate_leaf(hostname);
    {
        std::unique_lock lock(cacheMu_);
        leafCache_[hostname] = leaf;
    }
    log_debug("issued leaf certificate for {}", hostname);
    return leaf;
}

bool CertificateAuthority::verify_leaf(const LeafCertificate& leaf) const {
    if (!has_ca() || !leaf.cert) return false;
    X509_STORE* store = X509_STORE_new();
    X509_STORE_CTX* sctx = X509_STORE_CTX_new();
    bool ok = false;
    if (store && sctx && X509_STORE_add_cert(store, caCert_.get()) == 1 &&
        X509_STORE_CTX_init(sctx, store, leaf.cert.get(), nullptr) == 1) {
        X509_STORE_CTX_set_purpose(sctx, X509_PURPOSE_SSL_SERVER);
        ok = X509_verify_cert(sctx) == 1;
    }
    X509_STORE_CTX_free(sctx);
    X509_STORE_free(store);
    return ok;
}

std::size_t CertificateAuthority::cached_leaf_count() const {
    std::shared_lock lock(cacheMu_);
    return leafCache_.size();
}

std::string CertificateAuthority::ca_cert_pem() const {
    if (!caCert_) return {};
    return to_pem(caCert_.get());
}

std::string CertificateAuthority::ca_cert_der() const {
    if (!caCert_) return {};
    unsigned char* buf = nullptr;
    const int len = i2d_X509(caCert_.get(), &buf);
    if (len <= 0 || !buf) return {};
    std::string der(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(len));
    OPENSSL_free(buf);
    return der;
}

// Colon separated upper-case hex, e.g. "AB:CD:...".
std::string CertificateAuthority::ca_fingerprint_sha256() const {
    if (!caCert_) return {};
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (!X509_digest(caCert_.get(), EVP_sha256(), digest, &digestLen)) return {};
    std::string fingerprint;
    for (unsigned int i = 0; i < digestLen; ++i) {
        if (i > 0) fingerprint += ':';
        fingerprint += fmt::format("{:02X}", digest[i]);
    }
    return fingerprint;
}

void CertificateAuthority::export_ca_cert(const std::string& path) const {
    if (!caCert_) throw TlsError("no CA certificate loaded");
    auto pem = ca_cert_pem();
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) throw TlsError("failed to create export file " + path);
    ofs.write(pem.data(), static_cast<std::streamsize>(pem.size()));
    if (!ofs) throw TlsError("failed to write export file " + path);
}
}
