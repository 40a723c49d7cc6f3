#pragma once

#include "Middleware.hpp"
#include "models.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace http_resilience {

enum class CircuitState { Closed, Open, HalfOpen };

// "CLOSED", "OPEN" or "HALF_OPEN"
const char* stateName(CircuitState state);

/**
 * Decides whether a finished call counts as a failure.
 */
using FailurePredicate = std::function<bool(const HttpResponse&)>;

struct CircuitBreakerConfig {
    uint32_t failureThreshold = 5;                      // Consecutive failures that open the circuit
    std::chrono::milliseconds recoveryTimeout{60000};   // Time spent Open before probing
    uint32_t halfOpenMaxCalls = 3;                      // Probes admitted while HalfOpen

    FailurePredicate errorPredicate;                    // Empty = any error or status >= 500
    std::function<void(CircuitState from, CircuitState to)> onStateChange;  // Called outside the state lock
};

/**
 * Consecutive-failure circuit breaker.
 *
 * Closed -> Open after failureThreshold consecutive failures.
 * Open -> HalfOpen once recoveryTimeout has elapsed since the last failure;
 * the call that observes this is admitted as the first probe.
 * HalfOpen -> Closed on a success, HalfOpen -> Open on a failure.
 *
 * Admission and result recording are each atomic under one mutex.
 */
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    explicit CircuitBreaker(CircuitBreakerConfig config = CircuitBreakerConfig());

    // Non-copyable
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * Check whether a call may proceed, consuming a probe slot when HalfOpen.
     * On rejection the reason is written to rejectReason when given.
     */
    bool admit(std::string* rejectReason = nullptr);

    // Record the outcome of an admitted call using the configured predicate
    void record(const HttpResponse& response);
    void recordOutcome(bool failure);

    bool isFailure(const HttpResponse& response) const;

    CircuitState state() const;
    uint32_t consecutiveFailures() const;
    uint32_t halfOpenProbesUsed() const;
    Clock::time_point lastTransitionAt() const;

    // Open or HalfOpen
    bool isOpen() const;

    // Force Closed with zeroed counters
    void reset();

    std::string toString() const;

    const CircuitBreakerConfig& config() const { return this->config_; }

private:
    struct Transition {
        CircuitState from;
        CircuitState to;
    };

    std::optional<Transition> transitionLocked(CircuitState to);
    void notify(const std::optional<Transition>& transition) const;

    CircuitBreakerConfig config_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::Closed;
    uint32_t consecutiveFailures_ = 0;
    uint32_t halfOpenProbesUsed_ = 0;
    Clock::time_point lastTransitionAt_ = Clock::now();
    Clock::time_point lastFailureAt_ = Clock::now();
};

/**
 * Guards the next handler with a shared CircuitBreaker.
 * Rejected calls return HttpError::CircuitOpen without invoking next.
 */
class CircuitBreakerMiddleware : public Middleware {
public:
    explicit CircuitBreakerMiddleware(CircuitBreakerConfig config = CircuitBreakerConfig());
    explicit CircuitBreakerMiddleware(std::shared_ptr<CircuitBreaker> breaker);

    Handler wrap(Handler next) override;

    const std::shared_ptr<CircuitBreaker>& breaker() const { return this->breaker_; }

private:
    std::shared_ptr<CircuitBreaker> breaker_;
};

} // namespace http_resilience
