#include "streamdrop/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace streamdrop {

bool RetryPolicy::allowsRetry(unsigned failures) const noexcept {
    return max_attempts == 0 || failures < max_attempts;
}

std::chrono::milliseconds RetryPolicy::delayFor(unsigned failures) const noexcept {
    if (failures == 0) {
        return std::chrono::milliseconds{0};
    }

    const double base = static_cast<double>(initial_delay.count());
    const double cap = static_cast<double>(max_delay.count());
    // Exponent is clamped so the intermediate value cannot overflow.
    const double exponent = static_cast<double>(std::min(failures - 1, 32u));
    const double delay = std::min(base * std::pow(std::max(multiplier, 1.0), exponent), cap);
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(delay)};
}

} // namespace streamdrop
