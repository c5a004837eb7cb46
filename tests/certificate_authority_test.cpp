#include "trafficlens/core/tls/CertificateAuthority.h"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

using namespace trafficlens::core::tls;
namespace fs = std::filesystem;

int main() {
    fs::path dir = fs::temp_directory_path() / ("trafficlens_ca_test_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    std::string certPath = (dir / "nested" / "ca.crt").string();
    std::string keyPath = (dir / "nested" / "ca.key").string();

    // 1. Generate when files are missing, parent directory included
    CertConfig cfg{certPath, keyPath, true};
    auto ca1 = CertificateAuthority::create(cfg);
    assert(ca1->has_ca());
    assert(fs::exists(certPath));
    assert(fs::exists(keyPath));
    auto keyPerms = fs::status(keyPath).permissions();
    assert((keyPerms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none);
    auto fp1 = ca1->ca_fingerprint_sha256();
    assert(fp1.size() == 32 * 3 - 1);

    // 2. Reload keeps the same CA
    auto ca2 = CertificateAuthority::create(cfg);
    assert(ca2->has_ca());
    assert(ca2->ca_fingerprint_sha256() == fp1);

    // 3. PEM / DER / export
    auto pem = ca2->ca_cert_pem();
    assert(pem.find("BEGIN CERTIFICATE") != std::string::npos);
    assert(!ca2->ca_cert_der().empty());
    std::string exported = (dir / "exported.pem").string();
    ca2->export_ca_cert(exported);
    std::ifstream ifs(exported, std::ios::binary);
    std::stringstream ss; ss << ifs.rdbuf();
    assert(ss.str() == pem);

    // 4. Missing files without generation -> error
    CertConfig noGen{(dir / "missing.crt").string(), (dir / "missing.key").string(), false};
    bool threw = false;
    try {
        CertificateAuthority::create(noGen);
    } catch (const TlsError& e) {
        threw = std::string(e.what()).find("failed to load CA certificate") != std::string::npos;
    }
    assert(threw);
    assert(!fs::exists(dir / "missing.crt"));

    // 5. A key that does not belong to the certificate is rejected
    {
        std::string otherCert = (dir / "other" / "ca.crt").string();
        std::string otherKey = (dir / "other" / "ca.key").string();
        CertificateAuthority::create(CertConfig{otherCert, otherKey, true});
        bool mismatch = false;
        try {
            CertificateAuthority::create(CertConfig{certPath, otherKey, false});
        } catch (const TlsError&) {
            mismatch = true;
        }
        assert(mismatch);
    }

    // 6. Leaf issuance, verification and caching
    auto leaf1 = ca2->cert_for_host("Example.com");
    assert(leaf1 && leaf1->cert && leaf1->key && leaf1->serverCtx);
    assert(leaf1->hostname == "example.com");
    assert(leaf1->chain.size() == 1);
    assert(ca2->verify_leaf(*leaf1));
    // The generated and reloaded instances hold the same root
    assert(ca1->verify_leaf(*leaf1));
    auto leaf2 = ca2->cert_for_host("example.com:443");
    assert(leaf1 == leaf2);
    assert(ca2->cached_leaf_count() == 1);

    auto ipLeaf = ca2->cert_for_host("127.0.0.1");
    assert(ca2->verify_leaf(*ipLeaf));
    assert(ca2->cached_leaf_count() == 2);

    // Long names skip the CN but still verify through the SAN
    std::string longHost = std::string(70, 'a') + ".test";
    auto longLeaf = ca2->cert_for_host(longHost);
    assert(ca2->verify_leaf(*longLeaf));

    // A leaf from another CA does not verify
    {
        auto other = CertificateAuthority::create(CertConfig{(dir / "other" / "ca.crt").string(), (dir / "other" / "ca.key").string(), false});
        auto foreign = other->cert_for_host("example.com");
        assert(!ca2->verify_leaf(*foreign));
    }

    bool emptyHost = false;
    try { ca2->cert_for_host(""); } catch (const TlsError&) { emptyHost = true; }
    assert(emptyHost);

    fs::remove_all(dir);
    return 0;
}
