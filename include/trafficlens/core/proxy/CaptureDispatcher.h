#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include "trafficlens/core/proxy/CapturedRequest.h"
#include "trafficlens/core/util/WorkQueue.h"

namespace trafficlens::core::proxy {
using ListenerHandle = uint64_t;

// Fans captures out to subscribers. Each subscriber has its own bounded queue
// and dispatch thread, so a slow listener never stalls the publisher or the
// other listeners. A full queue drops the event for that subscriber only.
class CaptureDispatcher {
public:
    using Callback = std::function<void(const CapturePtr&)>;

    explicit CaptureDispatcher(std::size_t queue_capacity = 256);
    ~CaptureDispatcher();
    CaptureDispatcher(const CaptureDispatcher&) = delete;
    CaptureDispatcher& operator=(const CaptureDispatcher&) = delete;

    ListenerHandle add(std::shared_ptr<CaptureListener> listener);
    ListenerHandle add(Callback callback);
    // Events already queued for the subscriber are still delivered before
    // this returns. Unknown handles return false.
    bool remove(ListenerHandle handle);
    void publish(const CapturePtr& capture);
    uint64_t dropped() const { return droppedTotal.load(std::memory_order_relaxed); }

private:
    struct Subscriber {
        explicit Subscriber(std::size_t cap) : queue(cap) {}
        std::shared_ptr<CaptureListener> listener;
        util::WorkQueue queue;
        std::thread worker;
    };
    void retire(const std::shared_ptr<Subscriber>& sub);

    std::size_t queueCapacity;
    mutable std::mutex guard;
    ListenerHandle nextHandle{1};
    std::map<ListenerHandle, std::shared_ptr<Subscriber>> subscribers;
    std::atomic<uint64_t> droppedTotal{0};
};
}
