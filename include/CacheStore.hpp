#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace http_resilience {

/**
 * A stored response. Stores hand out copies, so callers can never
 * modify cached state through an entry they received.
 */
struct CacheEntry {
	using Clock = std::chrono::system_clock;

	std::string key;
	long status = 0;
	std::vector<std::string> headers; // "Name: value"
	std::string body;
	std::string requestURL;

	Clock::time_point createdAt;
	Clock::time_point lastAccessed;
	Clock::time_point expiresAt; // fixed at write

	bool expired(Clock::time_point now = Clock::now()) const { return now >= this->expiresAt; }
};

// Thrown by stores when a write or clear cannot be completed
class CacheError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * Backend of the response cache. Implementations are safe for concurrent use.
 */
class CacheStore {
public:
	virtual ~CacheStore() = default;

	// A copy of the entry, empty when missing or expired
	virtual std::optional<CacheEntry> get(const std::string& key) = 0;

	// Throws CacheError when the entry cannot be stored
	virtual void set(const std::string& key, const CacheEntry& entry) = 0;

	virtual void remove(const std::string& key) = 0;
	virtual void clear() = 0;

	// Stops background maintenance. The store stays usable afterwards.
	virtual void close() = 0;
};

} // namespace http_resilience
