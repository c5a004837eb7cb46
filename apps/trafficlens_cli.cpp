#include "trafficlens/core/proxy/ProxyServer.h"
#include "trafficlens/core/proxy/CaptureLogListener.h"
#include "trafficlens/core/proxy/CaptureFileStore.h"
#include "trafficlens/core/util/Cancellation.h"
#include "trafficlens/core/util/Logger.h"
#include <charconv>
#include <csignal>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <pthread.h>
#include <signal.h>
#include <fmt/format.h>

using namespace trafficlens::core::proxy;
using namespace trafficlens::core::util;

namespace {
void print_help() {
    fmt::print("Usage: trafficlens_cli [options]\n"
               "  --listen ADDR        listen address, host:port or :port (default :8080)\n"
               "  --port N             listen port on all interfaces\n"
               "  --no-mitm            tunnel HTTPS instead of decrypting it\n"
               "  --ca-cert PATH       root CA certificate (PEM)\n"
               "  --ca-key PATH        root CA private key (PEM)\n"
               "  --no-generate-ca     fail instead of generating a missing CA\n"
               "  --export-ca PATH     write the CA certificate to PATH and exit\n"
               "  --buffer N           number of captures kept in memory (default 1000)\n"
               "  --max-body N         bytes of each body kept in a capture (default 10485760)\n"
               "  --include HOST       only capture matching hosts (repeatable, *.suffix allowed)\n"
               "  --exclude HOST       never capture matching hosts (repeatable)\n"
               "  --capture-file PATH  append each capture to PATH as a JSON line\n"
               "  --log-level L        trace|debug|info|warn|error|critical\n"
               "  -v, --verbose        same as --log-level debug\n"
               "  -h, --help           show this help\n");
}

template <typename T>
bool parse_number(const std::string& s, T& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

void print_stats(const CaptureStats& s) {
    fmt::print("captured {} requests, {} bytes sent, {} bytes received, avg {} ms\n",
               s.totalCount, s.totalRequestSize, s.totalResponseSize, s.avgDuration.count());
    for (auto& [method, n] : s.methodCounts) fmt::print("  {:<8} {}\n", method, n);
    for (auto& [code, n] : s.statusCounts) fmt::print("  {:<8} {}\n", code == 0 ? std::string("error") : std::to_string(code), n);
}
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    Config cfg = Config::defaults();
    std::string captureFile;
    std::string exportCaFile;
    std::optional<Logger::Level> level;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        bool hasValue = i + 1 < args.size();
        if (a == "--help" || a == "-h") { print_help(); return 0; }
        if (a == "--verbose" || a == "-v") { cfg.with_verbose(true); continue; }
        if (a == "--no-mitm") { cfg.with_https(false); continue; }
        if (a == "--no-generate-ca") { cfg.with_auto_generate_ca(false); continue; }
        if (!hasValue) { fmt::print(stderr, "missing value for {}\n", a); return 2; }
        const auto& v = args[++i];
        if (a == "--listen") { cfg.with_listen_addr(v); continue; }
        if (a == "--port") {
            uint16_t port = 0;
            if (!parse_number(v, port)) { fmt::print(stderr, "invalid port {}\n", v); return 2; }
            cfg.with_listen_addr(":" + v);
            continue;
        }
        if (a == "--ca-cert") { cfg.caCertPath = v; continue; }
        if (a == "--ca-key") { cfg.caKeyPath = v; continue; }
        if (a == "--export-ca") { exportCaFile = v; continue; }
        if (a == "--buffer" || a == "--max-body") {
            std::size_t n = 0;
            if (!parse_number(v, n)) { fmt::print(stderr, "invalid number {} for {}\n", v, a); return 2; }
            if (a == "--buffer") cfg.with_buffer_size(n); else cfg.with_max_body_size(n);
            continue;
        }
        if (a == "--include") { cfg.includeHosts.push_back(v); continue; }
        if (a == "--exclude") { cfg.excludeHosts.push_back(v); continue; }
        if (a == "--capture-file") { captureFile = v; continue; }
        if (a == "--log-level") {
            level = Logger::parse_level(v);
            if (!level) { fmt::print(stderr, "unknown log level {}\n", v); return 2; }
            continue;
        }
        fmt::print(stderr, "unknown option {}\n", a);
        print_help();
        return 2;
    }
    if (level) Logger::instance().set_level(*level);

    // Handled by a dedicated sigwait thread; block before any thread starts.
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);

    try {
        ProxyServer server(cfg);
        if (!exportCaFile.empty()) {
            server.export_ca_cert(exportCaFile);
            fmt::print("exported CA certificate to {}\n", exportCaFile);
            return 0;
        }
        make_capture_log_listener(server.store());
        if (!captureFile.empty()) make_file_store(server.store(), captureFile);

        CancellationSource stopSource;
        std::promise<void> stopped;
        auto stoppedFuture = stopped.get_future();
        stopSource.token().subscribe([&stopped] { stopped.set_value(); });

        std::thread([stopSignals, stopSource]() mutable {
            int sig = 0;
            if (sigwait(&stopSignals, &sig) == 0) {
                log_info("received signal {}", sig);
                stopSource.cancel();
            }
        }).detach();
        std::thread([stopSource]() mutable {
            std::string line;
            if (std::getline(std::cin, line)) stopSource.cancel();
        }).detach();

        server.start(stopSource.token());
        if (auto ca = server.certificate_authority()) log_info("CA certificate {}", ca->config().caCertPath);
        fmt::print("proxy listening on {}, press Enter to stop\n", server.listen_address());
        stoppedFuture.wait();
        server.stop();
        print_stats(server.stats());
    } catch (const std::exception& e) {
        log_error("{}", e.what());
        return 1;
    }
    return 0;
}
