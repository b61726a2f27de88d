// include/cancellation.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <optional>

namespace ChunkStore {
namespace Concurrency {

// Shared stop signal for a transfer. Checked before each new backend call;
// calls already in flight are left to finish.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    // Cancels itself once `timeout` has elapsed.
    explicit CancellationToken(std::chrono::milliseconds timeout) : deadline_(Clock::now() + timeout) {}

    void cancel() { cancelled_.store(true); }

    bool isCancelled() const {
        return cancelled_.load() || (deadline_ && Clock::now() >= *deadline_);
    }

private:
    std::atomic<bool> cancelled_{false};
    std::optional<Clock::time_point> deadline_;
};

} // namespace Concurrency
} // namespace ChunkStore
