#include "Retry.hpp"
#include "Log.hpp"

#include <exception>
#include <sstream>

namespace http_resilience {

RetryExecutor::RetryExecutor(RetryConfig config) : config_(std::move(config)) {}

Handler RetryExecutor::wrap(Handler next) {
	return [this, next = std::move(next)](const Context& ctx, HttpRequest& request) -> HttpResponse {
		return this->execute(ctx, request, next);
	};
}

std::chrono::nanoseconds RetryExecutor::backoffDelay(uint32_t attempt) const {
	return retry::exponentialBackoff(attempt, this->config_.baseDelay, this->config_.maxDelay,
									 this->config_.jitterFactor, this->config_.jitterSource);
}

bool RetryExecutor::isRetryable(const HttpResponse& response) const {
	if (response.error)
		return this->config_.errorPredicate && this->config_.errorPredicate(response.error);
	return this->config_.retryableStatusCodes.count(response.status) > 0;
}

HttpResponse RetryExecutor::execute(const Context& ctx, HttpRequest& request, const Handler& next) const {
	if (ctx.done()) [[unlikely]]
		return HttpResponse::failure(ctx.err());

	const bool hasBody = request.body != nullptr;

	HttpResponse result = next(ctx, request);

	for (uint32_t attempt = 0; attempt < this->config_.maxRetries && this->isRetryable(result); ++attempt) {
		if (hasBody && !request.getBody) {
			Log::warn("retry: request body cannot be re-created, returning last result for " + request.url);
			return result;
		}

		// The previous body is never handed to the caller
		result.body.reset();

		auto delay = this->backoffDelay(attempt);
		{
			std::ostringstream msg;
			msg << "retry: attempt " << (attempt + 1) << "/" << this->config_.maxRetries << " for "
				<< request.methodName << " " << request.url << " in "
				<< std::chrono::duration_cast<std::chrono::milliseconds>(delay).count() << "ms ("
				<< (result.error ? result.error.message : "status " + std::to_string(result.status)) << ")";
			Log::debug(msg.str());
		}

		if (!ctx.sleepFor(delay) || ctx.done())
			return HttpResponse::failure(ctx.err());

		if (request.getBody) {
			std::shared_ptr<BodyReader> body;
			try {
				body = request.getBody();
			} catch (const std::exception& e) {
				Log::warn(std::string("retry: body factory failed: ") + e.what());
				return HttpResponse::failure(HttpError::make(HttpError::BodyUnavailable, e.what()));
			}
			if (hasBody && !body) {
				Log::warn("retry: body factory returned no body for " + request.url);
				return HttpResponse::failure(HttpError::make(HttpError::BodyUnavailable, "body factory returned no body"));
			}
			request.body = std::move(body);
		}

		result = next(ctx, request);
	}

	return result;
}

} // namespace http_resilience
