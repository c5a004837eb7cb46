#include "trafficlens/core/util/WorkQueue.h"

namespace trafficlens::core::util {
WorkQueue::WorkQueue(std::size_t capacity) : cap(capacity == 0 ? 1 : capacity) {}
WorkQueue::~WorkQueue() { stop(); }

bool WorkQueue::try_post(Task task) {
    {
        std::lock_guard lock(guard);
        if (!running.load() || tasks.size() >= cap) return false;
        tasks.push(std::move(task));
    }
    cv.notify_one();
    return true;
}

void WorkQueue::run() {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(guard);
            cv.wait(lock, [&]{ return !running.load() || !tasks.empty(); });
            if (tasks.empty()) return;
            task = std::move(tasks.front());
            tasks.pop();
        }
        if (task) task();
    }
}

std::size_t WorkQueue::pending() const {
    std::lock_guard lock(guard);
    return tasks.size();
}

void WorkQueue::stop() {
    {
        std::lock_guard lock(guard);
        running.store(false);
    }
    cv.notify_all();
}
}
