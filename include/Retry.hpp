#pragma once

#include "Middleware.hpp"
#include "RetryPolicy.hpp"
#include "RetryStrategies.hpp"

#include <chrono>
#include <cstdint>

namespace http_resilience {

/**
 * Re-issues a call through the next handler while its result is retryable.
 *
 * Retryable: an error accepted by errorPredicate, or a status listed in
 * retryableStatusCodes. Up to maxRetries additional attempts are made with
 * exponential backoff between them; the wait observes the context.
 *
 * A request body is re-created from HttpRequest::getBody before every retry.
 * Without a factory the retry path is abandoned and the last result returned.
 * After the final attempt the last result is returned unchanged.
 */
class RetryExecutor : public Middleware {
public:
    explicit RetryExecutor(RetryConfig config = RetryConfig());

    Handler wrap(Handler next) override;

    // Runs request through next with the retry policy applied
    HttpResponse execute(const Context& ctx, HttpRequest& request, const Handler& next) const;

    // Delay before retry number attempt (0-based)
    std::chrono::nanoseconds backoffDelay(uint32_t attempt) const;

    bool isRetryable(const HttpResponse& response) const;

    const RetryConfig& config() const { return this->config_; }

private:
    const RetryConfig config_;
};

} // namespace http_resilience
