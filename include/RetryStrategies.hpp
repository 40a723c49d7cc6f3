#pragma once

#include "RetryPolicy.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <tuple>
#include <type_traits>

namespace http_resilience {
namespace retry {

// ============ Error Predicates ============

/**
 * Default error predicate: every error is retryable.
 */
inline ErrorPredicate anyError() {
    return [](const HttpError& error) -> bool {
        return static_cast<bool>(error);
    };
}

/**
 * Retry only on transient CURL errors.
 */
inline ErrorPredicate transientCurlErrors() {
    return [](const HttpError& error) -> bool {
        if (error.kind != HttpError::Transport) return false;

        switch (error.curlCode) {
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_CONNECT:
            case CURLE_OPERATION_TIMEDOUT:
            case CURLE_SSL_CONNECT_ERROR:
            case CURLE_SEND_ERROR:
            case CURLE_RECV_ERROR:
            case CURLE_GOT_NOTHING:
                return true;
            default:
                return false;
        }
    };
}

/**
 * Retry on errors of the given kinds.
 */
inline ErrorPredicate errorKinds(std::set<HttpError::Kind> kinds) {
    return [kinds = std::move(kinds)](const HttpError& error) -> bool {
        return kinds.count(error.kind) > 0;
    };
}

// SAFINAE predictor for ErrorPredicate
template <class Fn>
using is_error_pred = std::is_invocable_r<bool, Fn&, const HttpError&>;

/**
 * Combine multiple predicates with OR logic.
 * Returns true if any predicate returns true.
 */
template <class... Fns,
          std::enable_if_t<
              (sizeof...(Fns) > 0) &&
              (is_error_pred<std::decay_t<Fns>>::value && ...) &&
              (std::is_copy_constructible_v<std::decay_t<Fns>> && ...),
              int> = 0>
inline ErrorPredicate anyOf(Fns&&... fns) {
    return [fs = std::tuple<std::decay_t<Fns>...>(std::forward<Fns>(fns)...)]
           (const HttpError& error) -> bool {
        return std::apply(
            [&](auto&... g) { return ((static_cast<bool>(g(error))) || ...); },
            fs
        );
    };
}

/**
 * Combine multiple predicates with AND logic.
 */
template <class... Fns,
          std::enable_if_t<
              (sizeof...(Fns) > 0) &&
              (is_error_pred<std::decay_t<Fns>>::value && ...) &&
              (std::is_copy_constructible_v<std::decay_t<Fns>> && ...),
              int> = 0>
inline ErrorPredicate allOf(Fns&&... fns) {
    return [fs = std::tuple<std::decay_t<Fns>...>(std::forward<Fns>(fns)...)]
           (const HttpError& error) -> bool {
        return std::apply(
            [&](auto&... g) { return ((static_cast<bool>(g(error))) && ...); },
            fs
        );
    };
}

// ============ Status Codes ============

/**
 * 408 (Request Timeout), 500, 502, 503, 504 (Server Errors)
 */
inline std::set<long> defaultStatusCodes() {
    return {408, 500, 502, 503, 504};
}

// ============ Backoff ============

/**
 * Exponential backoff with optional jitter, for retry number attempt (0-based).
 * delay = min(baseDelay * 2^attempt, maxDelay)
 * delay += delay * jitterFactor * jitter(), then clamped to [0, maxDelay]
 * A non-positive maxDelay leaves the delay uncapped.
 */
inline std::chrono::nanoseconds exponentialBackoff(
    uint32_t attempt,
    std::chrono::nanoseconds baseDelay,
    std::chrono::nanoseconds maxDelay,
    double jitterFactor,
    const JitterSource& jitter)
{
    const double cap = static_cast<double>(maxDelay.count());
    double delay = static_cast<double>(baseDelay.count()) * std::pow(2.0, static_cast<double>(attempt));
    if (cap > 0) delay = std::min(delay, cap);

    if (jitterFactor > 0) {
        double u = jitter ? jitter() : util::uniform_jitter();
        delay += delay * jitterFactor * std::clamp(u, -1.0, 1.0);
    }

    delay = std::max(0.0, delay);
    if (cap > 0) delay = std::min(delay, cap);
    delay = std::min(delay, static_cast<double>(std::chrono::nanoseconds::max().count() / 2));

    return std::chrono::nanoseconds(static_cast<std::chrono::nanoseconds::rep>(delay));
}

} // namespace retry

// Default constructor implementation for RetryConfig
inline RetryConfig::RetryConfig()
    : retryableStatusCodes(retry::defaultStatusCodes())
    , errorPredicate(retry::anyError())
{}

} // namespace http_resilience
