#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include "trafficlens/core/proxy/ClientSession.h"

namespace trafficlens::core::proxy {
// Live client sessions of one server, each running on its own thread.
class SessionRegistry : public std::enable_shared_from_this<SessionRegistry> {
public:
    // Runs the session on a new detached thread; it unregisters itself when done.
    // Returns false (and drops the session) once shutdown has begun.
    bool launch(std::shared_ptr<ClientSession> session);
    std::size_t size() const;
    // Closes idle sessions, lets busy ones finish for up to `grace`, aborts the
    // rest and waits for every session thread to leave. Returns how many were
    // aborted after the grace period.
    std::size_t shutdown(std::chrono::milliseconds grace);
    // Accept new sessions again after a shutdown.
    void reset();

private:
    void finished(const ClientSession* session);

    mutable std::mutex mu;
    std::condition_variable cv;
    std::unordered_map<const ClientSession*, std::shared_ptr<ClientSession>> sessions;
    bool stopping{false};
};
}
