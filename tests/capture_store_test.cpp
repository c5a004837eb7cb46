#include "trafficlens/core/proxy/CaptureStore.h"
#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace trafficlens::core::proxy;
using namespace std::chrono_literals;

namespace {
CapturedRequest make(std::string method, std::string host, std::string path, int status) {
    CapturedRequest c;
    c.method = std::move(method);
    c.host = std::move(host);
    c.path = std::move(path);
    c.url = "http://" + c.host + c.path;
    c.statusCode = status;
    return c;
}

// Records captures and lets the test wait for a given count.
struct Collector {
    std::mutex mu;
    std::condition_variable cv;
    std::vector<CapturePtr> seen;
    void push(const CapturePtr& c) {
        { std::lock_guard lk(mu); seen.push_back(c); }
        cv.notify_all();
    }
    bool wait_for(size_t n) {
        std::unique_lock lk(mu);
        return cv.wait_for(lk, 2s, [&] { return seen.size() >= n; });
    }
    size_t size() { std::lock_guard lk(mu); return seen.size(); }
};
}

int main() {
    // Ring bound: capacity 3, five inserts keep the newest three, newest first
    {
        CaptureStore store(3);
        for (const char* p : { "/a", "/b", "/c", "/d", "/e" }) store.add(make("GET", "x.test", p, 200));
        assert(store.count() == 3);
        assert(store.capacity() == 3);
        auto all = store.list();
        assert(all.size() == 3);
        assert(all[0]->path == "/e");
        assert(all[1]->path == "/d");
        assert(all[2]->path == "/c");
        assert(store.all().size() == 3);
    }

    // Capacity below one falls back to the default
    {
        CaptureStore store(0);
        assert(store.capacity() == CaptureStore::kDefaultCapacity);
    }

    // Ids and timestamps are assigned, list is newest first, get finds by id
    {
        CaptureStore store(10);
        auto first = store.add(make("GET", "x.test", "/1", 200));
        auto second = store.add(make("GET", "x.test", "/2", 200));
        assert(first->id != 0 && second->id > first->id);
        assert(first->timestamp.time_since_epoch().count() != 0);
        auto listed = store.list();
        assert(listed.front()->id == second->id);
        assert(store.get(first->id) == first);
        assert(store.get(999999999) == nullptr);

        CapturedRequest preset = make("GET", "x.test", "/3", 200);
        preset.id = 4242;
        assert(store.add(preset)->id == 4242);
    }

    // Combined filter: GET + 2xx matches only the GET/200
    {
        CaptureStore store(10);
        store.add(make("GET", "api.test", "/users", 200));
        store.add(make("POST", "api.test", "/users", 201));
        store.add(make("GET", "api.test", "/users", 500));
        FilterOptions f;
        f.method = "get";
        f.statusMin = 200;
        f.statusMax = 299;
        auto r = store.list(f);
        assert(r.size() == 1);
        assert(r[0]->method == "GET" && r[0]->statusCode == 200);

        FilterOptions onlyMin;
        onlyMin.statusMin = 400;
        assert(store.list(onlyMin).size() == 1);
    }

    // Host wildcard, path prefix, protocol, content type, size and time filters
    {
        CaptureStore store(10);
        auto a = make("GET", "api.example.com", "/v1/items", 200);
        a.isHttps = true;
        a.responseHeaders.push_back({ "Content-Type", "application/json; charset=utf-8" });
        a.responseSize = 500;
        store.add(a);
        auto b = make("GET", "example.com", "/V1/other", 404);
        b.responseHeaders.push_back({ "content-type", "text/html" });
        b.responseSize = 5000;
        store.add(b);

        FilterOptions f;
        f.host = "*.example.com";
        assert(store.list(f).size() == 1);
        f = {};
        f.host = "EXAMPLE.com";
        assert(store.list(f).size() == 1);
        f = {};
        f.pathPrefix = "/v1";
        assert(store.list(f).size() == 2);
        f = {};
        f.httpsOnly = true;
        assert(store.list(f).size() == 1 && store.list(f)[0]->host == "api.example.com");
        f = {};
        f.httpOnly = true;
        assert(store.list(f).size() == 1 && store.list(f)[0]->host == "example.com");
        f = {};
        f.contentType = "APPLICATION/json";
        assert(store.list(f).size() == 1);
        f = {};
        f.minSize = 1000;
        assert(store.list(f).size() == 1 && store.list(f)[0]->responseSize == 5000);
        f = {};
        f.maxSize = 1000;
        assert(store.list(f).size() == 1 && store.list(f)[0]->responseSize == 500);
        f = {};
        f.after = std::chrono::system_clock::now() + 1h;
        assert(store.list(f).empty());
        f = {};
        f.before = std::chrono::system_clock::now() + 1h;
        assert(store.list(f).size() == 2);
    }

    // Free-text search over url, headers and textual bodies
    {
        CaptureStore store(10);
        auto a = make("POST", "a.test", "/login", 200);
        a.requestBody = "{\"user\":\"Alice\"}";
        store.add(a);
        auto b = make("GET", "b.test", "/img", 200);
        b.responseBody = std::string("\0alice", 6);
        store.add(b);
        auto c = make("GET", "c.test", "/", 200);
        c.requestHeaders.push_back({ "X-Request-Id", "token-123" });
        store.add(c);
        auto d = make("GET", "d.test", "/big", 200);
        d.responseBody = std::string(1024 * 1024, 'a') + "alice";
        store.add(d);

        FilterOptions f;
        f.search = "ALICE";
        auto r = store.list(f);
        assert(r.size() == 1 && r[0]->host == "a.test");
        f.search = "token-123";
        assert(store.list(f).size() == 1);
        f.search = "c.test";
        assert(store.list(f).size() == 1);
    }

    // Offset then limit, applied newest first
    {
        CaptureStore store(10);
        for (int i = 0; i < 6; ++i) store.add(make("GET", "p.test", "/" + std::to_string(i), 200));
        FilterOptions f;
        f.offset = 1;
        f.limit = 2;
        auto r = store.list(f);
        assert(r.size() == 2);
        assert(r[0]->path == "/4" && r[1]->path == "/3");
        f.offset = 10;
        assert(store.list(f).empty());
    }

    // Stats
    {
        CaptureStore store(10);
        auto empty = store.stats();
        assert(empty.totalCount == 0);
        assert(empty.avgDuration.count() == 0);
        assert(empty.methodCounts.empty());

        auto a = make("GET", "s.test", "/", 200);
        a.requestSize = 10; a.responseSize = 100; a.duration = 10ms;
        store.add(a);
        auto b = make("POST", "s.test", "/", 500);
        b.requestSize = 20; b.responseSize = 200; b.duration = 30ms;
        store.add(b);
        auto e = make("GET", "t.test", "/", 0);
        e.error = "dial tcp t.test:80: connection refused";
        store.add(e);

        auto listed = store.list();
        assert(listed[0]->content_type().empty());
        assert(!listed[0]->is_success() && listed[1]->is_server_error() && listed[2]->is_success());
        assert(!listed[2]->is_redirect() && !listed[2]->is_client_error());

        auto s = store.stats();
        assert(s.totalCount == 3);
        assert(s.totalRequestSize == 30);
        assert(s.totalResponseSize == 300);
        assert(s.methodCounts["GET"] == 2 && s.methodCounts["POST"] == 1);
        assert(s.statusCounts[200] == 1 && s.statusCounts[500] == 1 && s.statusCounts[0] == 1);
        assert(s.hostCounts["s.test"] == 2 && s.hostCounts["t.test"] == 1);
        assert(s.avgDuration == 40ms / 3);
        assert(s.oldest <= s.newest);
    }

    // Clear resets everything
    {
        CaptureStore store(3);
        for (int i = 0; i < 5; ++i) store.add(make("GET", "c.test", "/", 200));
        store.clear();
        assert(store.count() == 0);
        assert(store.list().empty());
        store.add(make("GET", "c.test", "/after", 200));
        assert(store.count() == 1 && store.list()[0]->path == "/after");
    }

    // Listener handles: subscribe, receive, unsubscribe
    {
        CaptureStore store(10);
        Collector first, second;
        auto h1 = store.add_listener([&](const CapturePtr& c) { first.push(c); });
        auto h2 = store.add_listener([&](const CapturePtr& c) { second.push(c); });
        assert(h1 != 0 && h2 != 0 && h1 != h2);

        auto stored = store.add(make("GET", "l.test", "/one", 200));
        assert(first.wait_for(1));
        assert(second.wait_for(1));
        assert(first.seen[0] == stored);

        assert(store.remove_listener(h1));
        assert(!store.remove_listener(h1));
        store.add(make("GET", "l.test", "/two", 200));
        assert(second.wait_for(2));
        assert(first.size() == 1);
        assert(store.remove_listener(h2));
    }

    // A stalled listener loses events beyond its queue but never blocks add()
    {
        CaptureStore store(10);
        std::mutex gate;
        std::unique_lock hold(gate);
        std::atomic<int> delivered{0};
        auto h = store.add_listener([&](const CapturePtr&) {
            std::lock_guard lk(gate);
            ++delivered;
        });
        auto started = std::chrono::steady_clock::now();
        for (int i = 0; i < 400; ++i) store.add(make("GET", "slow.test", "/", 200));
        assert(std::chrono::steady_clock::now() - started < 2s);
        assert(store.dropped_notifications() > 0);
        hold.unlock();
        assert(store.remove_listener(h));
        assert(delivered.load() > 0 && delivered.load() < 400);
    }

    return 0;
}
