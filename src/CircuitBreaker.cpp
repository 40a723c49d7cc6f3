#include "CircuitBreaker.hpp"
#include "Log.hpp"

#include <exception>
#include <sstream>

namespace http_resilience {

namespace {

constexpr uint32_t kDefaultFailureThreshold = 5;
constexpr std::chrono::milliseconds kDefaultRecoveryTimeout{60000};
constexpr uint32_t kDefaultHalfOpenMaxCalls = 3;

constexpr const char* kOpenRejection = "circuit breaker is open - request rejected";
constexpr const char* kHalfOpenRejection = "circuit breaker is half-open and maximum test requests reached";

CircuitBreakerConfig sanitize(CircuitBreakerConfig config) {
	if (config.failureThreshold == 0)
		config.failureThreshold = kDefaultFailureThreshold;
	if (config.recoveryTimeout.count() <= 0)
		config.recoveryTimeout = kDefaultRecoveryTimeout;
	if (config.halfOpenMaxCalls == 0)
		config.halfOpenMaxCalls = kDefaultHalfOpenMaxCalls;
	return config;
}

} // namespace

const char* stateName(CircuitState state) {
	switch (state) {
		case CircuitState::Closed:   return "CLOSED";
		case CircuitState::Open:     return "OPEN";
		case CircuitState::HalfOpen: return "HALF_OPEN";
	}
	return "UNKNOWN";
}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config) : config_(sanitize(std::move(config))) {}

bool CircuitBreaker::admit(std::string* rejectReason) {
	std::optional<Transition> transition;
	bool admitted = false;
	const char* reason = nullptr;

	{
		std::lock_guard<std::mutex> lk(this->mutex_);

		switch (this->state_) {
			case CircuitState::Closed:
				admitted = true;
				break;

			case CircuitState::Open:
				if (Clock::now() - this->lastFailureAt_ >= this->config_.recoveryTimeout) {
					transition = this->transitionLocked(CircuitState::HalfOpen);
					this->halfOpenProbesUsed_ = 1;
					admitted = true;
				} else {
					reason = kOpenRejection;
				}
				break;

			case CircuitState::HalfOpen:
				if (this->halfOpenProbesUsed_ < this->config_.halfOpenMaxCalls) {
					++this->halfOpenProbesUsed_;
					admitted = true;
				} else {
					reason = kHalfOpenRejection;
				}
				break;
		}
	}

	this->notify(transition);

	if (!admitted && rejectReason)
		*rejectReason = reason;
	return admitted;
}

bool CircuitBreaker::isFailure(const HttpResponse& response) const {
	if (this->config_.errorPredicate)
		return this->config_.errorPredicate(response);
	return static_cast<bool>(response.error) || response.status >= 500;
}

void CircuitBreaker::record(const HttpResponse& response) {
	this->recordOutcome(this->isFailure(response));
}

void CircuitBreaker::recordOutcome(bool failure) {
	std::optional<Transition> transition;

	{
		std::lock_guard<std::mutex> lk(this->mutex_);

		if (failure) {
			this->lastFailureAt_ = Clock::now();
			switch (this->state_) {
				case CircuitState::Closed:
					if (++this->consecutiveFailures_ >= this->config_.failureThreshold)
						transition = this->transitionLocked(CircuitState::Open);
					break;
				case CircuitState::HalfOpen:
					transition = this->transitionLocked(CircuitState::Open);
					break;
				case CircuitState::Open:
					break;
			}
		} else {
			switch (this->state_) {
				case CircuitState::Closed:
					this->consecutiveFailures_ = 0;
					break;
				case CircuitState::HalfOpen:
					transition = this->transitionLocked(CircuitState::Closed);
					break;
				case CircuitState::Open:
					break;
			}
		}
	}

	this->notify(transition);
}

CircuitState CircuitBreaker::state() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->state_;
}

uint32_t CircuitBreaker::consecutiveFailures() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->consecutiveFailures_;
}

uint32_t CircuitBreaker::halfOpenProbesUsed() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->halfOpenProbesUsed_;
}

CircuitBreaker::Clock::time_point CircuitBreaker::lastTransitionAt() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->lastTransitionAt_;
}

bool CircuitBreaker::isOpen() const {
	return this->state() != CircuitState::Closed;
}

void CircuitBreaker::reset() {
	std::optional<Transition> transition;

	{
		std::lock_guard<std::mutex> lk(this->mutex_);
		transition = this->transitionLocked(CircuitState::Closed);
		this->consecutiveFailures_ = 0;
		this->halfOpenProbesUsed_ = 0;
	}

	this->notify(transition);
}

std::string CircuitBreaker::toString() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	std::ostringstream out;
	out << "CircuitBreaker [State: " << stateName(this->state_)
		<< ", Consecutive Errors: " << this->consecutiveFailures_ << "/" << this->config_.failureThreshold << "]";
	return out.str();
}

// Caller holds mutex_. Returns the transition to report, empty when the state does not change.
std::optional<CircuitBreaker::Transition> CircuitBreaker::transitionLocked(CircuitState to) {
	CircuitState from = this->state_;
	if (from == to) return std::nullopt;

	this->state_ = to;
	this->lastTransitionAt_ = Clock::now();

	switch (to) {
		case CircuitState::Closed:
			this->consecutiveFailures_ = 0;
			this->halfOpenProbesUsed_ = 0;
			break;
		case CircuitState::HalfOpen:
			this->halfOpenProbesUsed_ = 0;
			break;
		case CircuitState::Open:
			break;
	}

	return Transition{from, to};
}

void CircuitBreaker::notify(const std::optional<Transition>& transition) const {
	if (!transition) return;

	Log::info(std::string("circuit breaker: ") + stateName(transition->from) + " -> " + stateName(transition->to));

	if (this->config_.onStateChange)
		this->config_.onStateChange(transition->from, transition->to);
}

CircuitBreakerMiddleware::CircuitBreakerMiddleware(CircuitBreakerConfig config)
	: breaker_(std::make_shared<CircuitBreaker>(std::move(config))) {}

CircuitBreakerMiddleware::CircuitBreakerMiddleware(std::shared_ptr<CircuitBreaker> breaker)
	: breaker_(std::move(breaker)) {
	if (!this->breaker_)
		this->breaker_ = std::make_shared<CircuitBreaker>();
}

Handler CircuitBreakerMiddleware::wrap(Handler next) {
	std::shared_ptr<CircuitBreaker> breaker = this->breaker_;

	return [breaker, next = std::move(next)](const Context& ctx, HttpRequest& request) -> HttpResponse {
		std::string reason;
		if (!breaker->admit(&reason))
			return HttpResponse::failure(HttpError::make(HttpError::CircuitOpen, reason));

		HttpResponse response;
		try {
			response = next(ctx, request);
		} catch (const std::exception&) {
			breaker->recordOutcome(true);
			throw;
		}

		breaker->record(response);
		return response;
	};
}

} // namespace http_resilience
