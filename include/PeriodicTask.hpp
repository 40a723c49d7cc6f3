#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace http_resilience {

/**
 * Background thread that runs a job on a fixed interval until stopped.
 * A non-positive interval never starts the thread.
 */
class PeriodicTask {
public:
	PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> job);
	~PeriodicTask();

	PeriodicTask(const PeriodicTask&) = delete;
	PeriodicTask& operator=(const PeriodicTask&) = delete;

	// Wakes the thread and joins it. Idempotent.
	void stop();

	bool running() const;

private:
	void worker_loop();

	std::string name_;
	std::chrono::milliseconds interval_;
	std::function<void()> job_;

	mutable std::mutex mutex_;
	std::condition_variable cv_;
	bool stop_ = false;
	bool started_ = false;
	std::thread worker_;
};

} // namespace http_resilience
