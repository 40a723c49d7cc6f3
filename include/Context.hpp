#pragma once

#include "models.hpp"

#include <chrono>
#include <memory>
#include <optional>

namespace http_resilience {

/**
 * Cancellation token with an optional deadline, threaded through every
 * middleware and the transport.
 *
 * Copies share state. Children derived with withCancel()/withTimeout() are
 * cancelled together with their parent and inherit the earlier deadline.
 */
class Context {
public:
	using Clock = std::chrono::steady_clock;

	// A background context: never done unless cancel() is called
	Context();

	Context withCancel() const;
	Context withTimeout(std::chrono::nanoseconds timeout) const;

	void cancel() const;

	bool done() const;

	// Canceled or DeadlineExceeded once done(), an empty error before
	HttpError err() const;

	std::optional<Clock::time_point> deadline() const;

	/**
	 * Block for the given duration.
	 * Returns false as soon as the context is done, true if the full wait elapsed.
	 */
	bool sleepFor(std::chrono::nanoseconds duration) const;

private:
	struct State;

	explicit Context(std::shared_ptr<State> state);
	Context makeChild(std::optional<Clock::time_point> deadline) const;

	std::shared_ptr<State> state_;
};

} // namespace http_resilience
