#pragma once

#include <atomic>

namespace atdd {

/// Cooperative cancellation flag shared between a refinement run and
/// whoever may abort it (signal handler, watchdog thread, caller timeout).
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }
    void reset() { cancelled_.store(false, std::memory_order_release); }

private:
    std::atomic<bool> cancelled_{false};
};

inline bool isCancelled(const CancellationToken* token) {
    return token && token->isCancelled();
}

} // namespace atdd
