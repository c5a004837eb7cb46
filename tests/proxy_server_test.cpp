#include "trafficlens/core/proxy/ProxyServer.h"
#include "trafficlens/core/http/Headers.h"
#include "trafficlens/core/http/MessageReader.h"
#include "trafficlens/core/net/UpstreamConnector.h"
#include "trafficlens/core/tls/TlsStream.h"
#include "trafficlens/core/util/Cancellation.h"
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <unistd.h>
#include <fmt/format.h>

using namespace trafficlens::core;
using namespace trafficlens::core::proxy;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {
// Answers every request with "echo:<target>:<body>" and closes the connection.
// With a server context the connection is TLS.
class Backend {
public:
    explicit Backend(SSL_CTX* tlsCtx = nullptr) : ctx(tlsCtx) {
        bool ok = listener.open("127.0.0.1", 0);
        assert(ok);
        port = listener.local_endpoint()->port;
        worker = std::thread([this] { run(); });
    }
    ~Backend() {
        running.store(false);
        worker.join();
    }
    uint16_t port{0};
    std::atomic<int> served{0};

private:
    void run() {
        while (running.load()) {
            auto sock = listener.accept(50);
            if (!sock.valid()) continue;
            sock.set_timeouts(5000, 5000);
            if (ctx) {
                auto secure = tls::TlsStream::accept(sock, ctx);
                if (!secure) continue;
                serve(*secure);
                secure->shutdown();
            } else {
                serve(sock);
            }
        }
    }
    void serve(net::Stream& s) {
        http::MessageReader reader(s);
        http::HttpRequest req;
        if (reader.read_request(req) != http::MessageReader::Status::ok) return;
        std::string body;
        reader.read_body_capped(http::request_framing(req), 1 << 20, body);
        const std::string& target = req.request_line.target;
        if (target.rfind("/img", 0) == 0) {
            s.send_all("HTTP/1.1 200 OK\r\nContent-Type: image/png\r\nContent-Length: 100\r\n\r\n" + std::string(100, 'p'));
        } else if (target.rfind("/redir", 0) == 0) {
            s.send_all("HTTP/1.1 302 Found\r\nLocation: /elsewhere\r\nContent-Type: text/plain\r\nContent-Length: 100\r\n\r\n" + std::string(100, 'r'));
        } else {
            std::string out = "echo:" + target + ":" + body;
            s.send_all(fmt::format("HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: {}\r\nX-Backend: 1\r\n\r\n{}", out.size(), out));
        }
        ++served;
    }

    SSL_CTX* ctx;
    net::Listener listener;
    std::atomic<bool> running{true};
    std::thread worker;
};

net::Socket dial(const std::string& hostPort) {
    auto ep = net::parse_endpoint(hostPort, 0);
    assert(ep);
    auto sock = net::UpstreamConnector::connect(ep->host, ep->port, 2000);
    assert(sock);
    sock->set_timeouts(5000, 5000);
    return std::move(*sock);
}

std::string read_all(net::Stream& s) {
    std::string out;
    std::vector<char> buf(4096);
    while (auto n = s.recv_some(buf)) out.append(buf.data(), static_cast<size_t>(*n));
    return out;
}

std::string read_head(net::Stream& s) {
    std::string out;
    std::vector<char> one(1);
    while (out.find("\r\n\r\n") == std::string::npos) {
        auto n = s.recv_some(one);
        if (!n) break;
        out.push_back(one[0]);
    }
    return out;
}

template <typename Pred>
bool eventually(Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

uint16_t closed_port() {
    net::Listener l;
    bool ok = l.open("127.0.0.1", 0);
    assert(ok);
    return l.local_endpoint()->port;
}

Config plain_config() {
    return Config::defaults().with_https(false).with_listen_addr("127.0.0.1:0");
}
}

int main() {
    Backend backend;
    const std::string backendAuthority = fmt::format("127.0.0.1:{}", backend.port);

    // Plain forward proxying, lifecycle and captures
    {
        ProxyServer server(plain_config());
        assert(!server.is_running());
        assert(server.listen_address().empty());
        server.start();
        assert(server.is_running());
        const auto addr = server.listen_address();
        assert(!addr.empty() && addr.find(":0") == std::string::npos);

        bool threw = false;
        try { server.start(); } catch (const ProxyError&) { threw = true; }
        assert(threw);
        assert(server.is_running());

        // absolute-form GET
        {
            auto sock = dial(addr);
            assert(sock.send_all(fmt::format("GET http://{}/hello?x=1 HTTP/1.1\r\nHost: {}\r\nProxy-Connection: keep-alive\r\nConnection: close\r\n\r\n",
                                             backendAuthority, backendAuthority)));
            auto resp = read_all(sock);
            assert(resp.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
            assert(resp.find("X-Backend: 1") != std::string::npos);
            assert(resp.find("echo:/hello?x=1:") != std::string::npos);
        }
        assert(eventually([&] { return server.store().count() == 1; }));
        auto c = server.get_captures().front();
        assert(c->method == "GET");
        assert(c->url == fmt::format("http://{}/hello?x=1", backendAuthority));
        assert(c->path == "/hello");
        assert(c->host == backendAuthority);
        assert(c->statusCode == 200 && c->statusText == "OK");
        assert(c->responseBody == "echo:/hello?x=1:");
        assert(c->responseSize == c->responseBody.size());
        assert(!c->isHttps);
        assert(c->sourceIp == "127.0.0.1" && c->sourcePort != 0);
        assert(c->error.empty());
        assert(server.get_capture(c->id) == c);

        // POST with a chunked body, decoded in the capture
        {
            auto sock = dial(addr);
            assert(sock.send_all(fmt::format("POST http://{}/submit HTTP/1.1\r\nHost: {}\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n"
                                             "4\r\nname\r\n6\r\n=value\r\n0\r\n\r\n", backendAuthority, backendAuthority)));
            auto resp = read_all(sock);
            assert(resp.find("echo:/submit:name=value") != std::string::npos);
        }
        assert(eventually([&] { return server.store().count() == 2; }));
        FilterOptions posts;
        posts.method = "POST";
        auto p = server.get_captures(posts);
        assert(p.size() == 1);
        assert(p[0]->requestBody == "name=value");
        assert(p[0]->requestSize == 10);

        // Two requests on one keep-alive client connection
        {
            auto sock = dial(addr);
            http::MessageReader reader(sock);
            for (int i = 0; i < 2; ++i) {
                assert(sock.send_all(fmt::format("GET http://{}/ka{} HTTP/1.1\r\nHost: {}\r\n\r\n", backendAuthority, i, backendAuthority)));
                http::HttpResponse resp;
                assert(reader.read_response(resp) == http::MessageReader::Status::ok);
                assert(resp.status_line.code == 200);
                std::string body;
                assert(reader.read_body_capped(http::response_framing("GET", resp), 1024, body));
                assert(body == fmt::format("echo:/ka{}:", i));
            }
        }
        assert(eventually([&] { return server.store().count() == 4; }));

        // Unreachable origin: 502 and an error capture
        {
            auto dead = fmt::format("127.0.0.1:{}", closed_port());
            auto sock = dial(addr);
            assert(sock.send_all(fmt::format("GET http://{}/gone HTTP/1.1\r\nHost: {}\r\nConnection: close\r\n\r\n", dead, dead)));
            auto resp = read_all(sock);
            assert(resp.rfind("HTTP/1.1 502 ", 0) == 0);
        }
        assert(eventually([&] { return server.store().count() == 5; }));
        auto failed = server.get_captures().front();
        assert(failed->statusCode == 0);
        assert(!failed->error.empty());
        auto stats = server.stats();
        assert(stats.totalCount == 5);
        assert(stats.statusCounts[0] == 1);

        // Malformed request
        {
            auto sock = dial(addr);
            assert(sock.send_all("garbage\r\n\r\n"));
            auto resp = read_all(sock);
            assert(resp.rfind("HTTP/1.1 400 ", 0) == 0);
        }

        // CONNECT without interception is a raw tunnel
        {
            auto sock = dial(addr);
            assert(sock.send_all(fmt::format("CONNECT {} HTTP/1.1\r\nHost: {}\r\n\r\n", backendAuthority, backendAuthority)));
            auto head = read_head(sock);
            assert(head.rfind("HTTP/1.1 200 Connection Established\r\n", 0) == 0);
            assert(sock.send_all("GET /tunneled HTTP/1.1\r\nHost: x\r\n\r\n"));
            auto resp = read_all(sock);
            assert(resp.find("echo:/tunneled:") != std::string::npos);
        }
        // Tunnels are not captured
        std::this_thread::sleep_for(50ms);
        assert(server.store().count() == 5);

        // CONNECT to a dead port
        {
            auto sock = dial(addr);
            auto dead = fmt::format("127.0.0.1:{}", closed_port());
            assert(sock.send_all(fmt::format("CONNECT {} HTTP/1.1\r\nHost: {}\r\n\r\n", dead, dead)));
            assert(read_all(sock).rfind("HTTP/1.1 502 ", 0) == 0);
        }

        server.clear_captures();
        assert(server.store().count() == 0);
        bool noCa = false;
        try { server.export_ca_cert("unused.pem"); } catch (const ProxyError&) { noCa = true; }
        assert(noCa);
        assert(server.ca_cert_pem().empty());

        server.stop();
        assert(!server.is_running());
        server.stop();

        // Restart after stop
        server.start();
        assert(server.is_running());
        server.stop();
    }

    // Host admission: excluded hosts are proxied but not recorded
    {
        auto cfg = plain_config().with_exclude_hosts({ "127.0.0.1" });
        ProxyServer server(cfg);
        server.start();
        auto sock = dial(server.listen_address());
        assert(sock.send_all(fmt::format("GET http://{}/skip HTTP/1.1\r\nHost: {}\r\nConnection: close\r\n\r\n", backendAuthority, backendAuthority)));
        assert(read_all(sock).find("echo:/skip:") != std::string::npos);
        std::this_thread::sleep_for(50ms);
        assert(server.store().count() == 0);
        server.stop();
    }

    // Size cap on captured bodies; image bodies and redirects pass through untouched
    {
        auto cfg = plain_config().with_max_body_size(10);
        ProxyServer server(cfg);
        server.start();
        const auto addr = server.listen_address();

        const std::string payload(20, 'x');
        {
            auto sock = dial(addr);
            assert(sock.send_all(fmt::format("POST http://{}/big HTTP/1.1\r\nHost: {}\r\nContent-Length: 20\r\nConnection: close\r\n\r\n{}",
                                             backendAuthority, backendAuthority, payload)));
            auto resp = read_all(sock);
            assert(resp.find("echo:/big:" + payload) != std::string::npos);
        }
        assert(eventually([&] { return server.store().count() == 1; }));
        auto big = server.get_captures().front();
        assert(big->requestBody == std::string(10, 'x'));
        assert(big->requestSize == 20);
        assert(big->responseBody.size() == 10);
        assert(big->responseSize == std::string("echo:/big:" + payload).size());

        {
            auto sock = dial(addr);
            assert(sock.send_all(fmt::format("GET http://{}/img/logo.png HTTP/1.1\r\nHost: {}\r\nConnection: close\r\n\r\n", backendAuthority, backendAuthority)));
            auto resp = read_all(sock);
            assert(resp.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
            assert(resp.size() >= 100 && resp.compare(resp.size() - 100, 100, std::string(100, 'p')) == 0);
        }
        assert(eventually([&] { return server.store().count() == 2; }));
        auto img = server.get_captures().front();
        assert(img->statusCode == 200);
        assert(img->responseBody.empty());
        assert(img->responseSize == 100);

        std::this_thread::sleep_for(50ms);
        const int servedBefore = backend.served.load();
        {
            auto sock = dial(addr);
            assert(sock.send_all(fmt::format("GET http://{}/redir HTTP/1.1\r\nHost: {}\r\nConnection: close\r\n\r\n", backendAuthority, backendAuthority)));
            auto resp = read_all(sock);
            assert(resp.rfind("HTTP/1.1 302 Found\r\n", 0) == 0);
            assert(resp.find("Location: /elsewhere\r\n") != std::string::npos);
            assert(resp.find(std::string(100, 'r')) != std::string::npos);
        }
        assert(eventually([&] { return server.store().count() == 3; }));
        auto redir = server.get_captures().front();
        assert(redir->statusCode == 302);
        assert(redir->is_redirect());
        assert(redir->responseBody == std::string(10, 'r'));
        assert(redir->responseSize == 100);
        std::this_thread::sleep_for(50ms);
        assert(backend.served.load() == servedBefore + 1);
        assert(server.store().count() == 3);
        server.stop();
    }

    // Cancellation stops the server
    {
        ProxyServer server(plain_config());
        util::CancellationSource source;
        server.start(source.token());
        assert(server.is_running());
        source.cancel();
        assert(eventually([&] { return !server.is_running(); }));
        // A fresh run is not affected by the old token
        server.start();
        assert(server.is_running());
        server.stop();
    }

    // Stop closes idle client connections without waiting for the grace period
    {
        ProxyServer server(plain_config());
        server.start();
        auto sock = dial(server.listen_address());
        std::this_thread::sleep_for(200ms);
        auto begun = std::chrono::steady_clock::now();
        server.stop();
        assert(std::chrono::steady_clock::now() - begun < 4s);
        assert(read_all(sock).empty());
    }

    // Listen failure surfaces as ProxyError
    {
        ProxyServer first(plain_config());
        first.start();
        ProxyServer second(Config::defaults().with_https(false).with_listen_addr(first.listen_address()));
        bool threw = false;
        try { second.start(); } catch (const ProxyError&) { threw = true; }
        assert(threw);
        assert(!second.is_running());
        first.stop();
    }

    // HTTPS interception
    {
        fs::path dir = fs::temp_directory_path() / ("trafficlens_proxy_test_" + std::to_string(::getpid()));
        fs::remove_all(dir);
        std::string proxyCert = (dir / "proxy" / "ca.crt").string();
        std::string proxyKey = (dir / "proxy" / "ca.key").string();
        std::string originCert = (dir / "origin" / "ca.crt").string();

        // The origin presents a certificate from its own CA, trusted through upstreamCaFile
        auto originCa = tls::CertificateAuthority::create(tls::CertConfig{ originCert, (dir / "origin" / "ca.key").string(), true });
        auto originLeaf = originCa->cert_for_host("127.0.0.1");
        Backend secureBackend(originLeaf->serverCtx.get());
        const std::string secureAuthority = fmt::format("127.0.0.1:{}", secureBackend.port);

        auto cfg = Config::defaults()
                       .with_listen_addr("127.0.0.1:0")
                       .with_ca_paths(proxyCert, proxyKey)
                       .with_upstream_ca_file(originCert);
        ProxyServer server(cfg);
        assert(server.certificate_authority() != nullptr);
        assert(server.ca_cert_pem().find("BEGIN CERTIFICATE") != std::string::npos);
        server.start();

        auto sock = dial(server.listen_address());
        assert(sock.send_all(fmt::format("CONNECT {} HTTP/1.1\r\nHost: {}\r\n\r\n", secureAuthority, secureAuthority)));
        auto head = read_head(sock);
        assert(head.rfind("HTTP/1.1 200 ", 0) == 0);

        auto clientCtx = tls::make_client_context(proxyCert);
        std::string err;
        auto secure = tls::TlsStream::connect(sock, clientCtx.get(), "127.0.0.1", &err);
        assert(secure);
        assert(secure->send_all(fmt::format("POST /secure?q=2 HTTP/1.1\r\nHost: {}\r\nContent-Length: 5\r\nConnection: close\r\n\r\nhello", secureAuthority)));
        auto resp = read_all(*secure);
        assert(resp.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
        assert(resp.find("echo:/secure?q=2:hello") != std::string::npos);

        assert(eventually([&] { return server.store().count() == 1; }));
        auto c = server.get_captures().front();
        assert(c->isHttps);
        assert(c->url == fmt::format("https://{}/secure?q=2", secureAuthority));
        assert(c->path == "/secure");
        assert(c->requestBody == "hello");
        assert(c->statusCode == 200);
        assert(!c->tlsVersion.empty() && !c->tlsCipher.empty());
        assert(server.certificate_authority()->cached_leaf_count() == 1);

        // Without the origin's CA the upstream handshake fails and the client gets 502
        auto strictCfg = Config::defaults().with_listen_addr("127.0.0.1:0").with_ca_paths(proxyCert, proxyKey);
        ProxyServer strict(strictCfg);
        strict.start();
        auto sock2 = dial(strict.listen_address());
        assert(sock2.send_all(fmt::format("CONNECT {} HTTP/1.1\r\nHost: {}\r\n\r\n", secureAuthority, secureAuthority)));
        assert(read_head(sock2).rfind("HTTP/1.1 200 ", 0) == 0);
        auto secure2 = tls::TlsStream::connect(sock2, clientCtx.get(), "127.0.0.1", &err);
        assert(secure2);
        assert(secure2->send_all(fmt::format("GET / HTTP/1.1\r\nHost: {}\r\nConnection: close\r\n\r\n", secureAuthority)));
        assert(read_all(*secure2).rfind("HTTP/1.1 502 ", 0) == 0);
        assert(eventually([&] { return strict.store().count() == 1; }));
        assert(strict.get_captures().front()->error.find("certificate verify failed") != std::string::npos);
        strict.stop();

        // An absolute-form https:// request without CONNECT still reaches the origin over TLS
        {
            ProxyServer direct(plain_config().with_upstream_ca_file(originCert));
            direct.start();
            auto plain = dial(direct.listen_address());
            assert(plain.send_all(fmt::format("GET https://{}/secret HTTP/1.1\r\nHost: {}\r\nConnection: close\r\n\r\n", secureAuthority, secureAuthority)));
            auto directResp = read_all(plain);
            assert(directResp.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
            assert(directResp.find("echo:/secret:") != std::string::npos);
            assert(eventually([&] { return direct.store().count() == 1; }));
            auto dc = direct.get_captures().front();
            assert(dc->isHttps);
            assert(dc->url == fmt::format("https://{}/secret", secureAuthority));
            assert(dc->statusCode == 200);
            assert(!dc->tlsVersion.empty());
            assert(direct.certificate_authority() == nullptr);
            direct.stop();
        }

        // Same request with an untrusted origin certificate: 502, nothing sent in clear
        {
            std::this_thread::sleep_for(50ms);
            const int servedBefore = secureBackend.served.load();
            ProxyServer direct(plain_config());
            direct.start();
            auto plain = dial(direct.listen_address());
            assert(plain.send_all(fmt::format("GET https://{}/secret HTTP/1.1\r\nHost: {}\r\nConnection: close\r\n\r\n", secureAuthority, secureAuthority)));
            assert(read_all(plain).rfind("HTTP/1.1 502 ", 0) == 0);
            assert(eventually([&] { return direct.store().count() == 1; }));
            auto dc = direct.get_captures().front();
            assert(dc->isHttps);
            assert(dc->error.find("certificate verify failed") != std::string::npos);
            assert(secureBackend.served.load() == servedBefore);
            direct.stop();
        }

        server.stop();
        fs::remove_all(dir);
    }

    return 0;
}
