#include "RateLimiter.hpp"

namespace Scribe {

RateLimiter::RateLimiter(std::chrono::milliseconds minimumInterval)
    : minimumInterval_(minimumInterval.count() < 0 ? std::chrono::milliseconds(0) : minimumInterval) {
}

bool RateLimiter::tryAcquire() {
    if (!wouldAcquire()) {
        return false;
    }
    lastAcquired_.start();
    return true;
}

bool RateLimiter::wouldAcquire() const {
    if (!lastAcquired_.isValid() || minimumInterval_.count() == 0) {
        return true;
    }
    return lastAcquired_.elapsed() >= minimumInterval_.count();
}

void RateLimiter::reset() {
    lastAcquired_.invalidate();
}

void RateLimiter::setMinimumInterval(std::chrono::milliseconds interval) {
    minimumInterval_ = interval.count() < 0 ? std::chrono::milliseconds(0) : interval;
}

} // namespace Scribe
