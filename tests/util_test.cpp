#include "trafficlens/core/util/Cancellation.h"
#include "trafficlens/core/util/Logger.h"
#include "trafficlens/core/util/WorkQueue.h"
#include "trafficlens/core/net/Socket.h"
#include <atomic>
#include <cassert>
#include <string>
#include <thread>

using namespace trafficlens::core;

int main() {
    // WorkQueue: bounded, FIFO, drained on stop
    {
        util::WorkQueue q(2);
        std::string order;
        assert(q.try_post([&] { order += 'a'; }));
        assert(q.try_post([&] { order += 'b'; }));
        assert(!q.try_post([&] { order += 'c'; }));
        assert(q.pending() == 2);
        q.stop();
        assert(!q.try_post([&] { order += 'd'; }));
        q.run();
        assert(order == "ab");
        assert(q.pending() == 0);

        std::atomic<int> ran{0};
        util::WorkQueue worker(8);
        std::thread t([&] { worker.run(); });
        for (int i = 0; i < 5; ++i) assert(worker.try_post([&] { ++ran; }));
        worker.stop();
        t.join();
        assert(ran.load() == 5);
        assert(!worker.try_post([] {}));
    }

    // Cancellation
    {
        util::CancellationToken never;
        assert(!never.can_be_cancelled());
        assert(never.subscribe([] {}) == 0);

        util::CancellationSource src;
        auto token = src.token();
        assert(token.can_be_cancelled() && !token.is_cancelled());
        int fired = 0;
        auto reg = token.subscribe([&] { ++fired; });
        auto dropped = token.subscribe([&] { fired += 100; });
        assert(reg != 0 && dropped != 0);
        token.unsubscribe(dropped);
        src.cancel();
        src.cancel();
        assert(fired == 1);
        assert(token.is_cancelled() && src.is_cancelled());
        // Late subscribers run immediately
        token.subscribe([&] { ++fired; });
        assert(fired == 2);
    }

    // Logger levels
    {
        using util::Logger;
        assert(Logger::parse_level("debug") == Logger::Level::debug);
        assert(Logger::parse_level("warning") == Logger::Level::warn);
        assert(!Logger::parse_level("loud").has_value());
        auto& lg = Logger::instance();
        auto before = lg.level();
        lg.set_level(Logger::Level::error);
        assert(!lg.enabled(Logger::Level::info));
        assert(lg.enabled(Logger::Level::critical));
        lg.set_level(before);
    }

    // Endpoint parsing
    {
        auto a = net::parse_endpoint(":8080", 80);
        assert(a && a->host.empty() && a->port == 8080);
        auto b = net::parse_endpoint("example.com", 443);
        assert(b && b->host == "example.com" && b->port == 443);
        auto c = net::parse_endpoint("[::1]:9000", 80);
        assert(c && c->host == "::1" && c->port == 9000);
        auto d = net::parse_endpoint("127.0.0.1:0", 8080);
        assert(d && d->host == "127.0.0.1" && d->port == 0);
        assert(!net::parse_endpoint("host:99999", 80));
        assert(!net::parse_endpoint("host:abc", 80));
        assert(!net::parse_endpoint("[::1", 80));
    }

    return 0;
}
