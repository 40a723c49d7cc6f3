#pragma once

#include "CacheStore.hpp"
#include "PeriodicTask.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_map>

namespace http_resilience {

/**
 * Persistent store, one file per entry under a base directory.
 *
 * File layout:
 *   line 1  magic + format version
 *   line 2  JSON metadata (key, status, headers, requestURL, timestamps, bodySize)
 *   rest    raw body bytes
 *
 * Files are written to a temp file in the same directory and renamed over
 * the target, so a reader sees either the old entry or the new one.
 * The in-memory index is rebuilt from the directory on construction; corrupt
 * and expired files and leftover temp files are deleted during the scan.
 */
class DiskCache : public CacheStore {
public:
	static constexpr std::chrono::milliseconds DefaultCleanupInterval{std::chrono::hours(1)};
	static constexpr std::string_view FileExtension = ".cache";
	static constexpr std::string_view TempExtension = ".tmp";

	/**
	 * maxBytes == 0 means unlimited. A non-positive cleanupInterval disables the sweep.
	 * Throws CacheError if the directory cannot be created or scanned.
	 */
	explicit DiskCache(std::filesystem::path directory, uint64_t maxBytes = 0,
					   std::chrono::milliseconds cleanupInterval = DefaultCleanupInterval);
	~DiskCache() override;

	DiskCache(const DiskCache&) = delete;
	DiskCache& operator=(const DiskCache&) = delete;

	std::optional<CacheEntry> get(const std::string& key) override;
	void set(const std::string& key, const CacheEntry& entry) override;
	void remove(const std::string& key) override;
	void clear() override;
	void close() override;

	size_t size() const;
	uint64_t currentSize() const;
	uint64_t maxBytes() const { return this->maxBytes_; }
	const std::filesystem::path& directory() const { return this->directory_; }

	// Drops expired entries and entries whose file disappeared
	size_t purgeExpired();

	// md5(key) + FileExtension
	static std::string fileNameFor(const std::string& key);

	static std::string encode(const CacheEntry& entry);
	// Empty on any format violation
	static std::optional<CacheEntry> decode(std::string_view data);

private:
	struct IndexEntry {
		std::string filename;
		uint64_t size = 0;
		CacheEntry::Clock::time_point lastAccessed;
		CacheEntry::Clock::time_point expiresAt;
	};

	void loadIndex();
	void removeLocked(const std::string& key);
	void ensureSpaceLocked(uint64_t needed, const std::string& replacing);
	void writeAtomic(const std::filesystem::path& target, std::string_view bytes) const;

	const std::filesystem::path directory_;
	const uint64_t maxBytes_;

	mutable std::mutex mutex_;
	std::unordered_map<std::string, IndexEntry> index_;
	uint64_t currentSize_ = 0;

	std::unique_ptr<PeriodicTask> sweeper_;
};

} // namespace http_resilience
