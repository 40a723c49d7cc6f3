#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace http_resilience {
namespace Log {

namespace {

std::mutex sinkMutex;
Sink customSink;
std::atomic<Level> minLevel{Level::Info};

std::string timestamp() {
	auto now = std::chrono::system_clock::now();
	std::time_t t = std::chrono::system_clock::to_time_t(now);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

	// Called under sinkMutex
	std::tm tm = *std::gmtime(&t);
	std::ostringstream out;
	out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
	return out.str();
}

} // namespace

const char* levelToString(Level level) {
	switch (level) {
		case Level::Debug: return "DEBUG";
		case Level::Info:  return "INFO";
		case Level::Warn:  return "WARN";
		case Level::Error: return "ERROR";
	}
	return "UNKNOWN";
}

void log(Level level, const std::string& message) {
	if (level < minLevel.load(std::memory_order_relaxed))
		return;

	std::lock_guard<std::mutex> lk(sinkMutex);
	if (customSink) {
		customSink(level, message);
		return;
	}

	std::ostream& out = (level >= Level::Warn) ? std::cerr : std::cout;
	out << timestamp() << " [" << levelToString(level) << "] " << message << std::endl;
}

void debug(const std::string& message) { log(Level::Debug, message); }
void info(const std::string& message) { log(Level::Info, message); }
void warn(const std::string& message) { log(Level::Warn, message); }
void error(const std::string& message) { log(Level::Error, message); }

void setMinLevel(Level level) {
	minLevel.store(level, std::memory_order_relaxed);
}

Level getMinLevel() {
	return minLevel.load(std::memory_order_relaxed);
}

void setSink(Sink sink) {
	std::lock_guard<std::mutex> lk(sinkMutex);
	customSink = std::move(sink);
}

} // namespace Log
} // namespace http_resilience
