#include "broker_messaging/backoff.hpp"
#include <algorithm>
#include <cmath>

namespace broker_messaging {

std::chrono::milliseconds computeBackoffDelay(int attempt, const RetryPolicy& policy) {
    const double initial = static_cast<double>(std::max<int64_t>(0, policy.initialDelay.count()));
    const double ceiling = static_cast<double>(std::max<int64_t>(0, policy.maxDelay.count()));
    const double multiplier = std::max(1.0, policy.multiplier);
    const int exponent = std::max(1, attempt) - 1;

    double delay = initial * std::pow(multiplier, exponent);
    if (!std::isfinite(delay) || delay > ceiling) {
        delay = ceiling;
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

} // namespace broker_messaging
