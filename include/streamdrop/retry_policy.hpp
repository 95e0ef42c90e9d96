#pragma once

#include <chrono>

namespace streamdrop {

// Backoff schedule for transient failures. Failures are counted per streak:
// a request that moves data forward starts a new streak.
struct RetryPolicy {
    // Consecutive failures tolerated before giving up; 0 retries forever.
    unsigned max_attempts{0};
    std::chrono::milliseconds initial_delay{500};
    std::chrono::milliseconds max_delay{30000};
    double multiplier{2.0};

    [[nodiscard]] bool allowsRetry(unsigned failures) const noexcept;
    [[nodiscard]] std::chrono::milliseconds delayFor(unsigned failures) const noexcept;
};

} // namespace streamdrop
