#include "MemoryCache.hpp"
#include "Log.hpp"

namespace http_resilience {

MemoryCache::MemoryCache(size_t capacity, std::chrono::milliseconds cleanupInterval)
	: capacity_(capacity ? capacity : DefaultCapacity) {
	this->sweeper_ = std::make_unique<PeriodicTask>("memory cache sweep", cleanupInterval, [this] {
		size_t removed = this->purgeExpired();
		if (removed)
			Log::debug("memory cache: swept " + std::to_string(removed) + " expired entries");
	});
}

MemoryCache::~MemoryCache() {
	this->close();
}

std::optional<CacheEntry> MemoryCache::get(const std::string& key) {
	std::lock_guard<std::mutex> lk(this->mutex_);

	auto it = this->index_.find(key);
	if (it == this->index_.end())
		return std::nullopt;

	auto now = CacheEntry::Clock::now();
	if (it->second->expired(now)) {
		this->lru_.erase(it->second);
		this->index_.erase(it);
		return std::nullopt;
	}

	this->lru_.splice(this->lru_.begin(), this->lru_, it->second);
	it->second->lastAccessed = now;
	return *it->second;
}

void MemoryCache::set(const std::string& key, const CacheEntry& entry) {
	std::lock_guard<std::mutex> lk(this->mutex_);

	auto it = this->index_.find(key);
	if (it != this->index_.end()) {
		*it->second = entry;
		it->second->key = key;
		this->lru_.splice(this->lru_.begin(), this->lru_, it->second);
		return;
	}

	if (this->lru_.size() >= this->capacity_) {
		this->index_.erase(this->lru_.back().key);
		this->lru_.pop_back();
	}

	this->lru_.push_front(entry);
	this->lru_.front().key = key;
	this->index_[key] = this->lru_.begin();
}

void MemoryCache::remove(const std::string& key) {
	std::lock_guard<std::mutex> lk(this->mutex_);

	auto it = this->index_.find(key);
	if (it == this->index_.end())
		return;
	this->lru_.erase(it->second);
	this->index_.erase(it);
}

void MemoryCache::clear() {
	std::lock_guard<std::mutex> lk(this->mutex_);
	this->index_.clear();
	this->lru_.clear();
}

void MemoryCache::close() {
	if (this->sweeper_)
		this->sweeper_->stop();
}

size_t MemoryCache::size() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->lru_.size();
}

size_t MemoryCache::purgeExpired() {
	std::lock_guard<std::mutex> lk(this->mutex_);

	auto now = CacheEntry::Clock::now();
	size_t removed = 0;
	for (auto it = this->lru_.begin(); it != this->lru_.end();) {
		if (it->expired(now)) {
			this->index_.erase(it->key);
			it = this->lru_.erase(it);
			++removed;
		} else {
			++it;
		}
	}
	return removed;
}

} // namespace http_resilience
