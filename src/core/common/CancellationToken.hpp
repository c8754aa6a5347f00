#pragma once

#include <atomic>
#include <memory>

namespace Scribe {

// Copies share one flag; once requested, cancellation cannot be withdrawn.
class CancellationToken {
public:
    CancellationToken()
        : state_(std::make_shared<std::atomic<bool>>(false)) {}

    void requestCancellation() noexcept {
        state_->store(true, std::memory_order_release);
    }

    bool isCancellationRequested() const noexcept {
        return state_->load(std::memory_order_acquire);
    }

    bool sharesStateWith(const CancellationToken& other) const noexcept {
        return state_ == other.state_;
    }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

} // namespace Scribe
