#pragma once
#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <vector>
#include "trafficlens/core/proxy/CapturedRequest.h"
#include "trafficlens/core/proxy/CaptureDispatcher.h"

namespace trafficlens::core::proxy {
bool matches_filter(const CapturedRequest& c, const FilterOptions& filter);

// Fixed-capacity ring of captures. Once full, each add overwrites the oldest.
class CaptureStore {
public:
    static constexpr std::size_t kDefaultCapacity = 1000;

    explicit CaptureStore(std::size_t capacity = kDefaultCapacity);
    CaptureStore(const CaptureStore&) = delete;
    CaptureStore& operator=(const CaptureStore&) = delete;

    // Assigns an id and timestamp when unset, stores the record and notifies
    // listeners. Returns the stored record.
    CapturePtr add(CapturedRequest capture);
    CapturePtr get(uint64_t id) const;
    // Newest first, filtered, then offset and limit applied.
    std::vector<CapturePtr> list(const FilterOptions& filter = {}) const;
    std::vector<CapturePtr> all() const;
    std::size_t count() const;
    std::size_t capacity() const { return cap; }
    CaptureStats stats() const;
    void clear();

    ListenerHandle add_listener(std::shared_ptr<CaptureListener> listener) { return dispatcher.add(std::move(listener)); }
    ListenerHandle add_listener(CaptureDispatcher::Callback callback) { return dispatcher.add(std::move(callback)); }
    bool remove_listener(ListenerHandle handle) { return dispatcher.remove(handle); }
    uint64_t dropped_notifications() const { return dispatcher.dropped(); }

private:
    // Visits stored captures newest to oldest until fn returns false. Caller holds mu.
    template <typename Fn>
    void for_each_newest(Fn&& fn) const {
        for (std::size_t i = 0; i < size; ++i) {
            std::size_t idx = (head + cap - 1 - i) % cap;
            if (!fn(ring[idx])) return;
        }
    }

    std::size_t cap;
    mutable std::shared_mutex mu;
    std::vector<CapturePtr> ring;
    std::size_t head{0};
    std::size_t size{0};
    CaptureDispatcher dispatcher;
};
}
