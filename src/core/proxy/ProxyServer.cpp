#include "trafficlens/core/proxy/ProxyServer.h"
#include "trafficlens/core/proxy/ClientSession.h"
#include "trafficlens/core/util/Logger.h"
#include <filesystem>
#include <system_error>

namespace trafficlens::core::proxy {
using util::Logger;
using util::log_error;
using util::log_info;

ProxyServer::ProxyServer(Config config)
    : cfg(std::move(config)), captures(cfg.bufferSize), sessions(std::make_shared<SessionRegistry>()) {
    if (cfg.verbose && !Logger::instance().enabled(Logger::Level::debug)) Logger::instance().set_level(Logger::Level::debug);
    if (cfg.enableHttps) {
        if (cfg.caCertPath.empty() || cfg.caKeyPath.empty()) {
            std::filesystem::path dir = Config::default_ca_dir();
            if (cfg.caCertPath.empty()) cfg.caCertPath = (dir / "ca.crt").string();
            if (cfg.caKeyPath.empty()) cfg.caKeyPath = (dir / "ca.key").string();
        }
        tls::CertConfig cc;
        cc.caCertPath = cfg.caCertPath;
        cc.caKeyPath = cfg.caKeyPath;
        cc.generateIfMissing = cfg.autoGenerateCa;
        authority = tls::CertificateAuthority::create(cc);
    }
    handler = std::make_unique<ProxyHandler>(cfg, captures, authority);
}

ProxyServer::~ProxyServer() {
    stop();
    if (watcher.joinable()) watcher.join();
}

void ProxyServer::start(util::CancellationToken token) {
    // A watcher left over from a cancellation-triggered stop is joined first.
    std::thread stale;
    {
        std::unique_lock lock(stateMu);
        if (running) throw ProxyError("proxy server is already running");
        stale = std::move(watcher);
    }
    if (stale.joinable()) stale.join();

    std::unique_lock lock(stateMu);
    if (running) throw ProxyError("proxy server is already running");
    auto ep = net::parse_endpoint(cfg.listenAddr, 8080);
    if (!ep) throw ProxyError("invalid listen address " + cfg.listenAddr);
    std::string err;
    if (!listener.open(ep->host, ep->port, &err)) throw ProxyError("listen " + cfg.listenAddr + ": " + err);
    auto local = listener.local_endpoint();
    boundAddr = local ? local->to_string() : cfg.listenAddr;

    sessions->reset();
    accepting.store(true);
    try {
        acceptThread = std::thread(&ProxyServer::accept_loop, this);
    } catch (const std::system_error& e) {
        accepting.store(false);
        listener.close();
        throw ProxyError(std::string("cannot start accept thread: ") + e.what());
    }
    running = true;

    if (token.can_be_cancelled()) {
        auto w = std::make_shared<Watch>();
        watchState = w;
        cancelToken = token;
        watcher = std::thread(&ProxyServer::watch, this, w);
        cancelReg = cancelToken.subscribe([w] {
            {
                std::lock_guard lk(w->mu);
                w->fired = true;
            }
            w->cv.notify_all();
        });
    }
    log_info("proxy listening on {} (https interception {})", boundAddr, handler->intercepting() ? "on" : "off");
}

void ProxyServer::stop() { shutdown(nullptr); }

void ProxyServer::shutdown(const Watch* origin) {
    std::thread watcherToJoin;
    std::size_t forced = 0;
    {
        std::unique_lock lock(stateMu);
        if (!running) return;
        // A watcher from an earlier run must not stop this one.
        if (origin && origin != watchState.get()) return;
        accepting.store(false);
        if (acceptThread.joinable()) acceptThread.join();
        listener.close();
        forced = sessions->shutdown(kShutdownGrace);
        running = false;
        boundAddr.clear();

        cancelToken.unsubscribe(cancelReg);
        cancelReg = 0;
        cancelToken = {};
        if (watchState) {
            {
                std::lock_guard lk(watchState->mu);
                watchState->done = true;
            }
            watchState->cv.notify_all();
            watchState.reset();
        }
        if (watcher.joinable() && watcher.get_id() != std::this_thread::get_id()) watcherToJoin = std::move(watcher);
    }
    if (watcherToJoin.joinable()) watcherToJoin.join();
    log_info("proxy stopped ({} connections forced closed)", forced);
}

void ProxyServer::watch(std::shared_ptr<Watch> w) {
    {
        std::unique_lock lk(w->mu);
        w->cv.wait(lk, [&] { return w->fired || w->done; });
        if (w->done) return;
    }
    log_info("cancellation requested, stopping proxy");
    shutdown(w.get());
}

void ProxyServer::accept_loop() {
    while (accepting.load()) {
        net::Endpoint peer;
        auto sock = listener.accept(100, &peer);
        if (!sock.valid()) continue;
        auto session = std::make_shared<ClientSession>(std::move(sock), peer, *handler);
        try {
            if (!sessions->launch(std::move(session))) break;
        } catch (const std::system_error& e) {
            log_error("cannot start session for {}: {}", peer.to_string(), e.what());
        }
    }
}

bool ProxyServer::is_running() const {
    std::shared_lock lock(stateMu);
    return running;
}

std::string ProxyServer::listen_address() const {
    std::shared_lock lock(stateMu);
    return boundAddr;
}

void ProxyServer::export_ca_cert(const std::string& path) const {
    if (!authority) throw ProxyError("HTTPS interception not enabled");
    authority->export_ca_cert(path);
}

std::string ProxyServer::ca_cert_pem() const {
    return authority ? authority->ca_cert_pem() : std::string();
}
}
