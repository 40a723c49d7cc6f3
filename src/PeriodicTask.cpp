#include "PeriodicTask.hpp"
#include "Log.hpp"

#include <exception>

namespace http_resilience {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> job)
	: name_(std::move(name)), interval_(interval), job_(std::move(job)) {
	if (this->interval_.count() > 0 && this->job_) {
		this->started_ = true;
		this->worker_ = std::thread(&PeriodicTask::worker_loop, this);
	}
}

PeriodicTask::~PeriodicTask() {
	this->stop();
}

void PeriodicTask::stop() {
	{
		std::lock_guard<std::mutex> lk(this->mutex_);
		this->stop_ = true;
	}
	this->cv_.notify_all();

	if (this->worker_.joinable() && this->worker_.get_id() != std::this_thread::get_id())
		this->worker_.join();
}

bool PeriodicTask::running() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->started_ && !this->stop_;
}

void PeriodicTask::worker_loop() {
	while (1) {
		{
			std::unique_lock<std::mutex> lk(this->mutex_);
			if (this->cv_.wait_for(lk, this->interval_, [this] { return this->stop_; }))
				break;
		}

		try {
			this->job_();
		} catch (const std::exception& e) {
			Log::warn(this->name_ + ": periodic job failed: " + e.what());
		}
	}
}

} // namespace http_resilience
