#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "trafficlens/core/net/Socket.h"
#include "trafficlens/core/proxy/CaptureStore.h"
#include "trafficlens/core/proxy/Config.h"
#include "trafficlens/core/proxy/ProxyHandler.h"
#include "trafficlens/core/proxy/SessionRegistry.h"
#include "trafficlens/core/tls/CertificateAuthority.h"
#include "trafficlens/core/util/Cancellation.h"

namespace trafficlens::core::proxy {
class ProxyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ProxyServer {
public:
    static constexpr std::chrono::milliseconds kShutdownGrace{5000};

    // Builds the store and, with HTTPS interception enabled, loads or
    // generates the CA. CA failures throw tls::TlsError.
    explicit ProxyServer(Config cfg = Config::defaults());
    ~ProxyServer();
    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    // Binds and starts accepting. Cancelling `token` stops the server.
    // Throws ProxyError when already running or when binding fails.
    void start(util::CancellationToken token = {});
    // Graceful: idle connections close at once, active ones get kShutdownGrace.
    void stop();

    bool is_running() const;
    // Bound address as host:port; empty when stopped.
    std::string listen_address() const;
    const Config& config() const { return cfg; }
    CaptureStore& store() { return captures; }

    std::vector<CapturePtr> get_captures(const FilterOptions& filter = {}) const { return captures.list(filter); }
    CapturePtr get_capture(uint64_t id) const { return captures.get(id); }
    CaptureStats stats() const { return captures.stats(); }
    void clear_captures() { captures.clear(); }

    void export_ca_cert(const std::string& path) const;
    // Empty when interception is disabled.
    std::string ca_cert_pem() const;
    std::shared_ptr<tls::CertificateAuthority> certificate_authority() const { return authority; }

    ListenerHandle add_listener(std::shared_ptr<CaptureListener> listener) { return captures.add_listener(std::move(listener)); }
    ListenerHandle add_listener(CaptureDispatcher::Callback callback) { return captures.add_listener(std::move(callback)); }
    bool remove_listener(ListenerHandle handle) { return captures.remove_listener(handle); }

private:
    struct Watch {
        std::mutex mu;
        std::condition_variable cv;
        bool fired{false};
        bool done{false};
    };
    void accept_loop();
    void watch(std::shared_ptr<Watch> w);
    // origin is set when a cancellation watcher triggers the stop.
    void shutdown(const Watch* origin);

    Config cfg;
    CaptureStore captures;
    std::shared_ptr<tls::CertificateAuthority> authority;
    std::unique_ptr<ProxyHandler> handler;
    std::shared_ptr<SessionRegistry> sessions;

    mutable std::shared_mutex stateMu;
    bool running{false};
    net::Listener listener;
    std::string boundAddr;
    std::atomic<bool> accepting{false};
    std::thread acceptThread;

    util::CancellationToken cancelToken;
    util::CancellationToken::Registration cancelReg{0};
    std::shared_ptr<Watch> watchState;
    std::thread watcher;
};
}
