#pragma once

#include "broker_messaging/types.hpp"
#include <chrono>

namespace broker_messaging {

/**
 * @brief Delay to wait before the given attempt.
 *
 * Computes min(initialDelay * multiplier^(attempt-1), maxDelay). The result is
 * never negative and never exceeds maxDelay, however large the attempt number.
 * Attempts below 1 are treated as the first attempt and a multiplier below 1 as 1.
 *
 * @param attempt 1-based attempt number
 * @param policy Retry policy supplying the delay bounds
 */
std::chrono::milliseconds computeBackoffDelay(int attempt, const RetryPolicy& policy);

} // namespace broker_messaging
