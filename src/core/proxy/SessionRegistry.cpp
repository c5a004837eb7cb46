#include "trafficlens/core/proxy/SessionRegistry.h"
#include "trafficlens/core/util/Logger.h"
#include <system_error>
#include <thread>
#include <vector>

namespace trafficlens::core::proxy {
using util::log_debug;
using util::log_info;

bool SessionRegistry::launch(std::shared_ptr<ClientSession> session) {
    {
        std::lock_guard lock(mu);
        if (stopping) return false;
        sessions.emplace(session.get(), session);
    }
    const ClientSession* key = session.get();
    try {
        std::thread([self = shared_from_this(), session]() mutable {
            session->start();
            const ClientSession* done = session.get();
            session.reset();
            self->finished(done);
        }).detach();
    } catch (const std::system_error&) {
        finished(key);
        throw;
    }
    return true;
}

void SessionRegistry::finished(const ClientSession* session) {
    std::shared_ptr<ClientSession> last;
    std::lock_guard lock(mu);
    auto it = sessions.find(session);
    if (it != sessions.end()) {
        last = std::move(it->second);
        sessions.erase(it);
    }
    cv.notify_all();
}

std::size_t SessionRegistry::size() const {
    std::lock_guard lock(mu);
    return sessions.size();
}

std::size_t SessionRegistry::shutdown(std::chrono::milliseconds grace) {
    std::unique_lock lock(mu);
    stopping = true;
    std::size_t idle = 0;
    for (auto& [key, s] : sessions) {
        s->finish_after_current();
        if (s->idle()) { s->abort(); ++idle; }
    }
    if (!sessions.empty()) log_debug("closed {} idle sessions, {} still active", idle, sessions.size() - idle);

    std::size_t forced = 0;
    if (!cv.wait_for(lock, grace, [&] { return sessions.empty(); })) {
        forced = sessions.size();
        log_info("forcing {} sessions closed after {} ms", forced, grace.count());
        for (auto& [key, s] : sessions) s->abort();
    }
    cv.wait(lock, [&] { return sessions.empty(); });
    return forced;
}

void SessionRegistry::reset() {
    std::lock_guard lock(mu);
    stopping = false;
}
}
