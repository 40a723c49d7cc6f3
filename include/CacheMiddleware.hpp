#pragma once

#include "CacheStore.hpp"
#include "Middleware.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace http_resilience {

enum class CacheKeyStrategyType { MethodAndURL, URLOnly, FullRequest };

/**
 * Derives the store key of a request.
 */
class CacheKeyStrategy {
public:
	virtual ~CacheKeyStrategy() = default;
	// May replace request.body when it has to read it
	virtual std::string key(HttpRequest& request) const = 0;
};

// "GET:https://host/path"
class MethodURLKeyStrategy : public CacheKeyStrategy {
public:
	std::string key(HttpRequest& request) const override;
};

class URLOnlyKeyStrategy : public CacheKeyStrategy {
public:
	std::string key(HttpRequest& request) const override;
};

/**
 * md5 hex over method, URL, headers sorted by name and the body when
 * it is smaller than FullRequestKeyStrategy::MaxBodySize.
 */
class FullRequestKeyStrategy : public CacheKeyStrategy {
public:
	static constexpr size_t MaxBodySize = 1024 * 1024;
	std::string key(HttpRequest& request) const override;
};

std::unique_ptr<CacheKeyStrategy> makeKeyStrategy(CacheKeyStrategyType type);

struct TTLRule {
	std::string pattern;
	std::chrono::milliseconds ttl;
};

struct CacheConfig {
	bool enabled = true;
	std::chrono::milliseconds defaultTTL{std::chrono::minutes(10)};
	bool respectCacheControl = true;

	std::vector<std::string> includePatterns; // URL substrings; empty = every URL
	std::vector<std::string> excludePatterns; // URL substrings
	std::vector<std::string> excludeHosts;	  // exact "host[:port]"

	CacheKeyStrategyType keyStrategy = CacheKeyStrategyType::MethodAndURL;

	// TTL when the response carries no max-age or Expires. First match wins,
	// domain rules before path rules.
	std::vector<TTLRule> domainTTLRules; // exact host
	std::vector<TTLRule> pathTTLRules;	 // substring of the URL path
};

/**
 * Response cache for GET and HEAD.
 *
 * Hits are served from a copy of the stored entry without calling next.
 * Cacheable responses are buffered, handed back with a fresh body reader and
 * written to the store by a background thread; write failures are logged only.
 */
class CacheMiddleware : public Middleware {
public:
	explicit CacheMiddleware(std::shared_ptr<CacheStore> store, CacheConfig config = CacheConfig());
	~CacheMiddleware() override;

	CacheMiddleware(const CacheMiddleware&) = delete;
	CacheMiddleware& operator=(const CacheMiddleware&) = delete;

	Handler wrap(Handler next) override;

	HttpResponse handle(const Context& ctx, HttpRequest& request, const Handler& next);

	// Blocks until every queued write has reached the store
	void flush();

	bool shouldCache(const HttpRequest& request) const;
	bool isFresh(const CacheEntry& entry, const HttpRequest& request) const;
	bool isCacheable(const HttpResponse& response) const;
	CacheEntry::Clock::time_point expiration(const HttpRequest& request, const HttpResponse& response) const;
	std::chrono::milliseconds ttlFor(const std::string& url) const;

	static bool isCacheableMethod(const HttpRequest& request);
	static bool isCacheableStatus(long status);

	const std::shared_ptr<CacheStore>& store() const { return this->store_; }
	const CacheConfig& config() const { return this->config_; }

private:
	void enqueue(std::string key, CacheEntry entry);
	void worker_loop();

	std::shared_ptr<CacheStore> store_;
	const CacheConfig config_;
	std::unique_ptr<CacheKeyStrategy> keyStrategy_;

	std::mutex mutex_;
	std::condition_variable cv_;
	std::condition_variable idle_;
	std::queue<std::pair<std::string, CacheEntry>> writes_;
	bool writing_ = false;
	bool stop_ = false;
	std::thread worker_;
};

} // namespace http_resilience
