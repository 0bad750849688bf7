#pragma once

#include <atomic>
#include <memory>

namespace qtm {

/**
 * Cooperative cancellation flag shared between a caller and a running
 * creation. Copies share the same state; cancel() may be called from any
 * thread, including a signal-safe context via the raw atomic.
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { state_->store(true, std::memory_order_relaxed); }
    bool is_cancelled() const { return state_->load(std::memory_order_relaxed); }
    void reset() { state_->store(false, std::memory_order_relaxed); }

    std::atomic<bool>& flag() { return *state_; }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

} // namespace qtm
