#include "trafficlens/core/util/Cancellation.h"
#include <vector>

namespace trafficlens::core::util {
struct CancellationSource::State {
    std::mutex mu;
    bool cancelled{false};
    std::uint64_t nextId{1};
    std::map<std::uint64_t, CancellationToken::Callback> callbacks;
};

CancellationSource::CancellationSource() : state(std::make_shared<State>()) {}

void CancellationSource::cancel() {
    std::vector<CancellationToken::Callback> pending;
    {
        std::lock_guard lock(state->mu);
        if (state->cancelled) return;
        state->cancelled = true;
        for (auto& [id, cb] : state->callbacks) pending.push_back(std::move(cb));
        state->callbacks.clear();
    }
    for (auto& cb : pending) if (cb) cb();
}

bool CancellationSource::is_cancelled() const {
    std::lock_guard lock(state->mu);
    return state->cancelled;
}

CancellationToken CancellationSource::token() const { return CancellationToken(state); }

bool CancellationToken::is_cancelled() const {
    if (!state) return false;
    std::lock_guard lock(state->mu);
    return state->cancelled;
}

CancellationToken::Registration CancellationToken::subscribe(Callback cb) const {
    if (!state) return 0;
    {
        std::lock_guard lock(state->mu);
        if (!state->cancelled) {
            auto id = state->nextId++;
            state->callbacks.emplace(id, std::move(cb));
            return id;
        }
    }
    if (cb) cb();
    return 0;
}

void CancellationToken::unsubscribe(Registration id) const {
    if (!state || id == 0) return;
    std::lock_guard lock(state->mu);
    state->callbacks.erase(id);
}
}
