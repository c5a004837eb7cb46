#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace trafficlens::core::util {
class CancellationToken;

// Owner side of a cancellation signal. Copies share the same state.
class CancellationSource {
public:
    CancellationSource();
    void cancel();
    bool is_cancelled() const;
    CancellationToken token() const;
private:
    struct State;
    friend class CancellationToken;
    std::shared_ptr<State> state;
};

// Observer side. A default-constructed token is never cancelled.
class CancellationToken {
public:
    using Callback = std::function<void()>;
    using Registration = std::uint64_t;

    CancellationToken() = default;
    bool can_be_cancelled() const { return static_cast<bool>(state); }
    bool is_cancelled() const;
    // Callback runs on the cancelling thread, or immediately when already
    // cancelled. Returns 0 when the token cannot be cancelled.
    Registration subscribe(Callback cb) const;
    void unsubscribe(Registration id) const;
private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<CancellationSource::State> s) : state(std::move(s)) {}
    std::shared_ptr<CancellationSource::State> state;
};
}
