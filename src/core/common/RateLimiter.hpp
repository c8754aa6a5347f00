#pragma once

#include <QtCore/QElapsedTimer>
#include <chrono>

namespace Scribe {

/**
 * @brief Minimum-interval gate for high-frequency notifications
 *
 * tryAcquire() succeeds at most once per interval. The first call after
 * construction or reset() always succeeds. An interval of zero never blocks.
 */
class RateLimiter {
public:
    explicit RateLimiter(std::chrono::milliseconds minimumInterval = std::chrono::milliseconds(30));

    bool tryAcquire();
    bool wouldAcquire() const;
    void reset();

    void setMinimumInterval(std::chrono::milliseconds interval);
    std::chrono::milliseconds minimumInterval() const { return minimumInterval_; }

private:
    std::chrono::milliseconds minimumInterval_;
    QElapsedTimer lastAcquired_;
};

} // namespace Scribe
