#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <queue>
#include <mutex>
#include <condition_variable>

namespace trafficlens::core::util {
// Bounded FIFO of tasks drained by whoever calls run(). try_post never blocks:
// when the queue holds `capacity` tasks the new one is rejected.
class WorkQueue {
public:
    using Task = std::function<void()>;

    explicit WorkQueue(std::size_t capacity = 256);
    ~WorkQueue();
    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    bool try_post(Task task);
    // Runs tasks until stop(); pending tasks are drained before returning.
    void run();
    void stop();
    std::size_t pending() const;
    std::size_t capacity() const { return cap; }

private:
    std::size_t cap;
    std::atomic<bool> running{true};
    mutable std::mutex guard;
    std::condition_variable cv;
    std::queue<Task> tasks;
};
}
