#include "Context.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace http_resilience {

struct Context::State {
	std::mutex mutex;
	std::condition_variable cv;
	bool canceled = false;
	std::optional<Clock::time_point> deadline;
	std::vector<std::weak_ptr<State>> children;

	bool expiredLocked(Clock::time_point now) const {
		return this->deadline && now >= *this->deadline;
	}
};

Context::Context() : state_(std::make_shared<State>()) {}

Context::Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

Context Context::makeChild(std::optional<Clock::time_point> deadline) const {
	auto child = std::make_shared<State>();

	std::lock_guard<std::mutex> lk(this->state_->mutex);
	child->deadline = this->state_->deadline;
	if (deadline && (!child->deadline || *deadline < *child->deadline))
		child->deadline = deadline;
	child->canceled = this->state_->canceled;

	// Drop children that are already gone before registering a new one
	auto& children = this->state_->children;
	children.erase(std::remove_if(children.begin(), children.end(),
								  [](const std::weak_ptr<State>& w) { return w.expired(); }),
				   children.end());
	children.push_back(child);

	return Context(child);
}

Context Context::withCancel() const {
	return this->makeChild(std::nullopt);
}

Context Context::withTimeout(std::chrono::nanoseconds timeout) const {
	return this->makeChild(Clock::now() + std::chrono::duration_cast<Clock::duration>(timeout));
}

void Context::cancel() const {
	std::vector<std::weak_ptr<State>> children;
	{
		std::lock_guard<std::mutex> lk(this->state_->mutex);
		if (this->state_->canceled)
			return;
		this->state_->canceled = true;
		children.swap(this->state_->children);
	}
	this->state_->cv.notify_all();

	for (auto& weak : children) {
		if (auto child = weak.lock())
			Context(child).cancel();
	}
}

bool Context::done() const {
	std::lock_guard<std::mutex> lk(this->state_->mutex);
	return this->state_->canceled || this->state_->expiredLocked(Clock::now());
}

HttpError Context::err() const {
	std::lock_guard<std::mutex> lk(this->state_->mutex);
	if (this->state_->canceled)
		return HttpError::make(HttpError::Canceled, "context canceled");
	if (this->state_->expiredLocked(Clock::now()))
		return HttpError::make(HttpError::DeadlineExceeded, "context deadline exceeded");
	return HttpError();
}

std::optional<Context::Clock::time_point> Context::deadline() const {
	std::lock_guard<std::mutex> lk(this->state_->mutex);
	return this->state_->deadline;
}

bool Context::sleepFor(std::chrono::nanoseconds duration) const {
	auto wakeAt = Clock::now() + std::chrono::duration_cast<Clock::duration>(duration);

	std::unique_lock<std::mutex> lk(this->state_->mutex);
	bool cutShort = false;
	if (this->state_->deadline && *this->state_->deadline < wakeAt) {
		wakeAt = *this->state_->deadline;
		cutShort = true;
	}

	bool canceled = this->state_->cv.wait_until(lk, wakeAt, [this] { return this->state_->canceled; });
	if (canceled)
		return false;
	return !cutShort;
}

} // namespace http_resilience
