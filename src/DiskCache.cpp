#include "DiskCache.hpp"
#include "Digest.hpp"
#include "Log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace http_resilience {

namespace {

constexpr std::string_view kMagic = "HTTPRCACHE 1";

int64_t toMillis(CacheEntry::Clock::time_point tp) {
	return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

CacheEntry::Clock::time_point fromMillis(int64_t ms) {
	return CacheEntry::Clock::time_point(std::chrono::duration_cast<CacheEntry::Clock::duration>(std::chrono::milliseconds(ms)));
}

bool endsWith(std::string_view s, std::string_view suffix) {
	return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<std::string> readFile(const fs::path& p) {
	std::ifstream in(p, std::ios::binary);
	if (!in) return std::nullopt;
	std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
	if (in.bad()) return std::nullopt;
	return data;
}

void removeFile(const fs::path& p) {
	std::error_code ec;
	fs::remove(p, ec);
	if (ec) Log::warn("disk cache: cannot remove " + p.string() + ": " + ec.message());
}

} // namespace

DiskCache::DiskCache(fs::path directory, uint64_t maxBytes, std::chrono::milliseconds cleanupInterval)
	: directory_(std::move(directory)), maxBytes_(maxBytes) {
	std::error_code ec;
	fs::create_directories(this->directory_, ec);
	if (ec) throw CacheError("failed to create cache directory " + this->directory_.string() + ": " + ec.message());

	this->loadIndex();

	this->sweeper_ = std::make_unique<PeriodicTask>("disk cache sweep", cleanupInterval, [this] {
		size_t removed = this->purgeExpired();
		if (removed)
			Log::debug("disk cache: swept " + std::to_string(removed) + " expired entries");
	});
}

DiskCache::~DiskCache() {
	this->close();
}

std::string DiskCache::fileNameFor(const std::string& key) {
	return Digest::md5Hex(key) + std::string(FileExtension);
}

std::string DiskCache::encode(const CacheEntry& entry) {
	nlohmann::json meta = {
		{"key", entry.key},
		{"status", entry.status},
		{"headers", entry.headers},
		{"requestURL", entry.requestURL},
		{"createdAt", toMillis(entry.createdAt)},
		{"lastAccessed", toMillis(entry.lastAccessed)},
		{"expiresAt", toMillis(entry.expiresAt)},
		{"bodySize", entry.body.size()},
	};

	std::string out;
	out.reserve(kMagic.size() + entry.body.size() + 256);
	out.append(kMagic);
	out += '\n';
	out += meta.dump();
	out += '\n';
	out += entry.body;
	return out;
}

std::optional<CacheEntry> DiskCache::decode(std::string_view data) {
	if (data.size() <= kMagic.size() || data.substr(0, kMagic.size()) != kMagic || data[kMagic.size()] != '\n')
		return std::nullopt;
	data.remove_prefix(kMagic.size() + 1);

	size_t eol = data.find('\n');
	if (eol == std::string_view::npos)
		return std::nullopt;

	CacheEntry entry;
	try {
		auto meta = nlohmann::json::parse(data.substr(0, eol));

		auto bodySize = meta.at("bodySize").get<uint64_t>();
		std::string_view body = data.substr(eol + 1);
		if (body.size() != bodySize)
			return std::nullopt;

		entry.key = meta.at("key").get<std::string>();
		entry.status = meta.at("status").get<long>();
		entry.headers = meta.at("headers").get<std::vector<std::string>>();
		entry.requestURL = meta.at("requestURL").get<std::string>();
		entry.createdAt = fromMillis(meta.at("createdAt").get<int64_t>());
		entry.lastAccessed = fromMillis(meta.at("lastAccessed").get<int64_t>());
		entry.expiresAt = fromMillis(meta.at("expiresAt").get<int64_t>());
		entry.body.assign(body.data(), body.size());
	} catch (const nlohmann::json::exception&) {
		return std::nullopt;
	}

	return entry;
}

void DiskCache::loadIndex() {
	std::lock_guard<std::mutex> lk(this->mutex_);

	this->index_.clear();
	this->currentSize_ = 0;

	std::error_code ec;
	fs::directory_iterator it(this->directory_, ec), end;
	if (ec) throw CacheError("failed to read cache directory " + this->directory_.string() + ": " + ec.message());

	auto now = CacheEntry::Clock::now();
	size_t purged = 0;

	for (; it != end; it.increment(ec)) {
		if (ec) throw CacheError("failed to read cache directory " + this->directory_.string() + ": " + ec.message());
		if (!it->is_regular_file(ec)) continue;

		const fs::path& p = it->path();
		std::string name = p.filename().string();

		// Interrupted writes leave their temp file behind
		if (endsWith(name, TempExtension)) {
			removeFile(p);
			++purged;
			continue;
		}
		if (!endsWith(name, FileExtension)) continue;

		auto data = readFile(p);
		std::optional<CacheEntry> entry;
		if (data) entry = decode(*data);

		if (!entry || entry->expired(now) || fileNameFor(entry->key) != name) {
			removeFile(p);
			++purged;
			continue;
		}

		uint64_t size = data->size();
		this->index_[entry->key] = IndexEntry{name, size, entry->lastAccessed, entry->expiresAt};
		this->currentSize_ += size;
	}

	if (purged)
		Log::info("disk cache: removed " + std::to_string(purged) + " stale files from " + this->directory_.string());
}

std::optional<CacheEntry> DiskCache::get(const std::string& key) {
	std::lock_guard<std::mutex> lk(this->mutex_);

	auto it = this->index_.find(key);
	if (it == this->index_.end())
		return std::nullopt;

	auto data = readFile(this->directory_ / it->second.filename);
	if (!data) {
		this->currentSize_ -= std::min(this->currentSize_, it->second.size);
		this->index_.erase(it);
		return std::nullopt;
	}

	auto entry = decode(*data);
	if (!entry || entry->key != key) {
		Log::warn("disk cache: purging corrupt entry " + it->second.filename);
		this->removeLocked(key);
		return std::nullopt;
	}

	auto now = CacheEntry::Clock::now();
	if (entry->expired(now)) {
		this->removeLocked(key);
		return std::nullopt;
	}

	it->second.lastAccessed = now;
	entry->lastAccessed = now;
	return entry;
}

void DiskCache::set(const std::string& key, const CacheEntry& entry) {
	CacheEntry stored = entry;
	stored.key = key;
	std::string bytes = encode(stored);
	std::string filename = fileNameFor(key);

	std::lock_guard<std::mutex> lk(this->mutex_);

	this->ensureSpaceLocked(bytes.size(), key);
	this->writeAtomic(this->directory_ / filename, bytes);

	auto it = this->index_.find(key);
	if (it != this->index_.end())
		this->currentSize_ -= std::min(this->currentSize_, it->second.size);

	this->index_[key] = IndexEntry{filename, bytes.size(), stored.lastAccessed, stored.expiresAt};
	this->currentSize_ += bytes.size();
}

void DiskCache::remove(const std::string& key) {
	std::lock_guard<std::mutex> lk(this->mutex_);
	this->removeLocked(key);
}

void DiskCache::clear() {
	std::lock_guard<std::mutex> lk(this->mutex_);

	this->index_.clear();
	this->currentSize_ = 0;

	std::error_code ec;
	fs::directory_iterator it(this->directory_, ec), end;
	if (ec) throw CacheError("failed to read cache directory " + this->directory_.string() + ": " + ec.message());

	for (; it != end; it.increment(ec)) {
		if (ec) throw CacheError("failed to read cache directory " + this->directory_.string() + ": " + ec.message());

		std::string name = it->path().filename().string();
		if (endsWith(name, FileExtension) || endsWith(name, TempExtension))
			removeFile(it->path());
	}
}

void DiskCache::close() {
	if (this->sweeper_)
		this->sweeper_->stop();
}

size_t DiskCache::size() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->index_.size();
}

uint64_t DiskCache::currentSize() const {
	std::lock_guard<std::mutex> lk(this->mutex_);
	return this->currentSize_;
}

size_t DiskCache::purgeExpired() {
	std::lock_guard<std::mutex> lk(this->mutex_);

	auto now = CacheEntry::Clock::now();
	std::vector<std::string> stale;
	for (const auto& [key, info] : this->index_) {
		std::error_code ec;
		if (now >= info.expiresAt || !fs::exists(this->directory_ / info.filename, ec))
			stale.push_back(key);
	}

	for (const auto& key : stale)
		this->removeLocked(key);
	return stale.size();
}

void DiskCache::removeLocked(const std::string& key) {
	auto it = this->index_.find(key);
	if (it == this->index_.end())
		return;

	std::error_code ec;
	fs::remove(this->directory_ / it->second.filename, ec);
	if (ec) Log::warn("disk cache: cannot remove " + it->second.filename + ": " + ec.message());

	this->currentSize_ -= std::min(this->currentSize_, it->second.size);
	this->index_.erase(it);
}

void DiskCache::ensureSpaceLocked(uint64_t needed, const std::string& replacing) {
	if (this->maxBytes_ == 0)
		return;

	// The entry being replaced frees its own space
	uint64_t used = this->currentSize_;
	auto current = this->index_.find(replacing);
	if (current != this->index_.end())
		used -= std::min(used, current->second.size);

	if (used + needed <= this->maxBytes_)
		return;

	std::vector<std::pair<CacheEntry::Clock::time_point, std::string>> candidates;
	candidates.reserve(this->index_.size());
	for (const auto& [key, info] : this->index_) {
		if (key != replacing)
			candidates.emplace_back(info.lastAccessed, key);
	}
	std::sort(candidates.begin(), candidates.end());

	for (const auto& [lastAccessed, key] : candidates) {
		if (used + needed <= this->maxBytes_)
			break;

		uint64_t size = this->index_[key].size;
		this->removeLocked(key);
		used -= std::min(used, size);
		Log::debug("disk cache: evicted " + key);
	}

	if (used + needed > this->maxBytes_)
		throw CacheError("not enough space available in cache after eviction");
}

void DiskCache::writeAtomic(const fs::path& target, std::string_view bytes) const {
	fs::path tmp = target;
	tmp += TempExtension;
	{
		std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
		if (!out)
			throw CacheError("open failed: " + tmp.string());
		out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
		out.flush();
		if (!out) {
			out.close();
			removeFile(tmp);
			throw CacheError("write failed: " + tmp.string());
		}
	}

	std::error_code ec;
	fs::rename(tmp, target, ec); // atomic on same filesystem
	if (ec) {
		removeFile(tmp);
		throw CacheError("failed to save cache file " + target.string() + ": " + ec.message());
	}
}

} // namespace http_resilience
