#include "trafficlens/core/proxy/CaptureDispatcher.h"
#include "trafficlens/core/util/Logger.h"
#include <vector>

namespace trafficlens::core::proxy {
using util::log_debug;
using util::log_warn;

namespace {
class CallbackListener : public CaptureListener {
public:
    explicit CallbackListener(CaptureDispatcher::Callback cb) : fn(std::move(cb)) {}
    void on_capture(const CapturePtr& capture) override { if (fn) fn(capture); }
private:
    CaptureDispatcher::Callback fn;
};
}

CaptureDispatcher::CaptureDispatcher(std::size_t queue_capacity) : queueCapacity(queue_capacity) {}

CaptureDispatcher::~CaptureDispatcher() {
    std::map<ListenerHandle, std::shared_ptr<Subscriber>> all;
    {
        std::lock_guard lock(guard);
        all.swap(subscribers);
    }
    for (auto& [handle, sub] : all) retire(sub);
}

ListenerHandle CaptureDispatcher::add(std::shared_ptr<CaptureListener> listener) {
    if (!listener) return 0;
    auto sub = std::make_shared<Subscriber>(queueCapacity);
    sub->listener = std::move(listener);
    // run() returns once the queue is stopped and drained.
    sub->worker = std::thread([sub] { sub->queue.run(); });
    std::lock_guard lock(guard);
    auto handle = nextHandle++;
    subscribers.emplace(handle, std::move(sub));
    return handle;
}

ListenerHandle CaptureDispatcher::add(Callback callback) {
    if (!callback) return 0;
    return add(std::make_shared<CallbackListener>(std::move(callback)));
}

bool CaptureDispatcher::remove(ListenerHandle handle) {
    std::shared_ptr<Subscriber> sub;
    {
        std::lock_guard lock(guard);
        auto it = subscribers.find(handle);
        if (it == subscribers.end()) return false;
        sub = std::move(it->second);
        subscribers.erase(it);
    }
    retire(sub);
    return true;
}

void CaptureDispatcher::retire(const std::shared_ptr<Subscriber>& sub) {
    sub->queue.stop();
    if (!sub->worker.joinable()) return;
    // A listener removing itself runs on its own worker thread.
    if (sub->worker.get_id() == std::this_thread::get_id()) sub->worker.detach();
    else sub->worker.join();
}

void CaptureDispatcher::publish(const CapturePtr& capture) {
    std::vector<std::pair<ListenerHandle, std::shared_ptr<Subscriber>>> alive;
    {
        std::lock_guard lock(guard);
        alive.assign(subscribers.begin(), subscribers.end());
    }
    for (auto& [handle, sub] : alive) {
        auto listener = sub->listener;
        bool queued = sub->queue.try_post([listener, capture] {
            try {
                listener->on_capture(capture);
            } catch (const std::exception& e) {
                log_warn("capture listener failed: {}", e.what());
            }
        });
        if (!queued) {
            droppedTotal.fetch_add(1, std::memory_order_relaxed);
            log_debug("listener {} queue full, dropped capture {}", handle, capture ? capture->id : 0);
        }
    }
}
}
