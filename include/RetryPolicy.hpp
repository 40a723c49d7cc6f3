#pragma once

#include "models.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <set>

namespace http_resilience {

/**
 * Type alias for the error classifier.
 * Returns true if a failed attempt with this error should be retried.
 */
using ErrorPredicate = std::function<bool(const HttpError&)>;

/**
 * Type alias for the jitter source.
 * Returns a value uniformly distributed in [-1, 1].
 */
using JitterSource = std::function<double()>;

/**
 * Configuration for retry behavior.
 * Copied by the RetryExecutor at construction, never mutated afterwards.
 */
struct RetryConfig {
    uint32_t maxRetries = 3;                        // Maximum retry attempts (not including initial)
    std::chrono::milliseconds baseDelay{100};       // Delay before the first retry
    std::chrono::milliseconds maxDelay{10000};      // Upper bound of any delay, 0 = no limit
    double jitterFactor = 0;                        // 0 = no jitter, 0.2 = +-20%

    std::set<long> retryableStatusCodes;            // Statuses that trigger a retry
    ErrorPredicate errorPredicate;                  // Errors that trigger a retry
    JitterSource jitterSource;                      // Empty = util::uniform_jitter

    // Default constructor - 408/500/502/503/504 and any error are retryable
    // Defined in RetryStrategies.hpp after factory functions are available
    RetryConfig();
};

} // namespace http_resilience
