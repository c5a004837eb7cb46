#include "trafficlens/core/proxy/CaptureStore.h"
#include "trafficlens/core/proxy/CapturePolicy.h"
#include "trafficlens/core/http/Headers.h"
#include <algorithm>
#include <atomic>
#include <cstring>
#include <mutex>

namespace trafficlens::core::proxy {
namespace {
std::atomic<uint64_t> nextId{1};
constexpr std::size_t kSearchableBodyLimit = 1024 * 1024;

bool headers_contain(const http::HeaderList& headers, std::string_view needle) {
    for (auto& h : headers) {
        if (http::icontains(h.name, needle) || http::icontains(h.value, needle)) return true;
    }
    return false;
}

bool body_contains(const std::string& body, std::string_view needle) {
    if (body.empty() || body.size() >= kSearchableBodyLimit) return false;
    if (std::memchr(body.data(), '\0', body.size()) != nullptr) return false;
    return http::icontains(body, needle);
}

bool search_matches(const CapturedRequest& c, std::string_view needle) {
    return http::icontains(c.url, needle) || http::icontains(c.host, needle) || http::icontains(c.path, needle) ||
           headers_contain(c.requestHeaders, needle) || headers_contain(c.responseHeaders, needle) ||
           body_contains(c.requestBody, needle) || body_contains(c.responseBody, needle);
}
}

std::string CapturedRequest::content_type() const {
    auto* v = http::find_header(responseHeaders, "Content-Type");
    return v ? *v : std::string();
}

bool matches_filter(const CapturedRequest& c, const FilterOptions& f) {
    if (!f.method.empty() && !http::iequals(c.method, f.method)) return false;
    if (!f.host.empty() && !match_host(c.host, f.host)) return false;
    if (!f.pathPrefix.empty() && !http::istarts_with(c.path, f.pathPrefix)) return false;
    if (f.statusMin > 0 && c.statusCode < f.statusMin) return false;
    if (f.statusMax > 0 && c.statusCode > f.statusMax) return false;
    if (!f.contentType.empty() && !http::istarts_with(c.content_type(), f.contentType)) return false;
    if (!f.search.empty() && !search_matches(c, f.search)) return false;
    if (f.minSize > 0 && c.responseSize < f.minSize) return false;
    if (f.maxSize > 0 && c.responseSize > f.maxSize) return false;
    if (f.after.time_since_epoch().count() != 0 && c.timestamp < f.after) return false;
    if (f.before.time_since_epoch().count() != 0 && c.timestamp > f.before) return false;
    if (f.httpsOnly && !c.isHttps) return false;
    if (f.httpOnly && c.isHttps) return false;
    return true;
}

CaptureStore::CaptureStore(std::size_t capacity) : cap(capacity < 1 ? kDefaultCapacity : capacity), ring(cap) {}

CapturePtr CaptureStore::add(CapturedRequest capture) {
    if (capture.id == 0) capture.id = nextId.fetch_add(1, std::memory_order_relaxed);
    if (capture.timestamp.time_since_epoch().count() == 0) capture.timestamp = std::chrono::system_clock::now();
    auto stored = std::make_shared<const CapturedRequest>(std::move(capture));
    {
        std::unique_lock lock(mu);
        ring[head] = stored;
        head = (head + 1) % cap;
        if (size < cap) ++size;
    }
    dispatcher.publish(stored);
    return stored;
}

CapturePtr CaptureStore::get(uint64_t id) const {
    std::shared_lock lock(mu);
    CapturePtr found;
    for_each_newest([&](const CapturePtr& c) {
        if (c->id == id) { found = c; return false; }
        return true;
    });
    return found;
}

std::vector<CapturePtr> CaptureStore::list(const FilterOptions& filter) const {
    std::vector<CapturePtr> out;
    std::size_t skipped = 0;
    std::shared_lock lock(mu);
    for_each_newest([&](const CapturePtr& c) {
        if (!matches_filter(*c, filter)) return true;
        if (skipped < filter.offset) { ++skipped; return true; }
        out.push_back(c);
        return filter.limit == 0 || out.size() < filter.limit;
    });
    return out;
}

std::vector<CapturePtr> CaptureStore::all() const {
    std::vector<CapturePtr> out;
    std::shared_lock lock(mu);
    out.reserve(size);
    for_each_newest([&](const CapturePtr& c) { out.push_back(c); return true; });
    return out;
}

std::size_t CaptureStore::count() const {
    std::shared_lock lock(mu);
    return size;
}

CaptureStats CaptureStore::stats() const {
    CaptureStats s;
    std::chrono::milliseconds totalDuration{0};
    std::shared_lock lock(mu);
    for_each_newest([&](const CapturePtr& c) {
        ++s.totalCount;
        s.totalRequestSize += c->requestSize;
        s.totalResponseSize += c->responseSize;
        ++s.methodCounts[c->method];
        ++s.statusCounts[c->statusCode];
        ++s.hostCounts[c->host];
        totalDuration += c->duration;
        if (s.totalCount == 1 || c->timestamp < s.oldest) s.oldest = c->timestamp;
        if (s.totalCount == 1 || c->timestamp > s.newest) s.newest = c->timestamp;
        return true;
    });
    if (s.totalCount > 0) s.avgDuration = totalDuration / static_cast<long long>(s.totalCount);
    return s;
}

void CaptureStore::clear() {
    std::unique_lock lock(mu);
    std::fill(ring.begin(), ring.end(), nullptr);
    head = 0;
    size = 0;
}
}
