#pragma once

#include "CacheStore.hpp"
#include "PeriodicTask.hpp"

#include <chrono>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace http_resilience {

/**
 * In-memory LRU store.
 *
 * set() on a full store evicts the least recently used entry, get() promotes.
 * Expired entries are dropped lazily by get() and by a periodic sweep.
 */
class MemoryCache : public CacheStore {
public:
	static constexpr size_t DefaultCapacity = 100;
	static constexpr std::chrono::milliseconds DefaultCleanupInterval{std::chrono::minutes(10)};

	// capacity 0 means DefaultCapacity, a non-positive interval disables the sweep
	explicit MemoryCache(size_t capacity = DefaultCapacity,
						 std::chrono::milliseconds cleanupInterval = DefaultCleanupInterval);
	~MemoryCache() override;

	std::optional<CacheEntry> get(const std::string& key) override;
	void set(const std::string& key, const CacheEntry& entry) override;
	void remove(const std::string& key) override;
	void clear() override;
	void close() override;

	size_t size() const;
	size_t capacity() const { return this->capacity_; }

	// Drops every expired entry, returns how many were removed
	size_t purgeExpired();

private:
	using LruList = std::list<CacheEntry>;

	const size_t capacity_;

	mutable std::mutex mutex_;
	LruList lru_; // front = most recently used
	std::unordered_map<std::string, LruList::iterator> index_;

	std::unique_ptr<PeriodicTask> sweeper_;
};

} // namespace http_resilience
