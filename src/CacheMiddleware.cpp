#include "CacheMiddleware.hpp"
#include "Digest.hpp"
#include "Log.hpp"
#include "UrlUtils.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <stdexcept>

namespace http_resilience {

namespace {

constexpr long kCacheableStatus[] = {200, 203, 204, 206, 300, 301, 404, 410};

// Reads at most limit + 1 bytes so that an oversized body is detected without draining it
std::string readBounded(BodyReader& reader, size_t limit) {
	std::string out;
	char buf[8192];
	size_t n;
	while (out.size() <= limit && (n = reader.read(buf, std::min(sizeof(buf), limit + 1 - out.size()))) > 0)
		out.append(buf, n);
	return out;
}

std::optional<long long> maxAge(const std::optional<std::string>& cacheControl) {
	if (!cacheControl) return std::nullopt;

	static constexpr std::string_view prefix = "max-age=";
	for (const auto& d : util::directives(*cacheControl)) {
		if (d.size() <= prefix.size() || !util::iequals(std::string_view(d).substr(0, prefix.size()), prefix))
			continue;

		std::string value = d.substr(prefix.size());
		char* end = nullptr;
		long long seconds = std::strtoll(value.c_str(), &end, 10);
		if (end && *end == '\0')
			return seconds;
	}
	return std::nullopt;
}

// now + d, saturating at the end of the clock's range. The headroom is
// compared in d's own unit so that converting d cannot overflow.
template <typename Rep, typename Period>
CacheEntry::Clock::time_point saturatingAdd(CacheEntry::Clock::time_point now, std::chrono::duration<Rep, Period> d) {
	using Clock = CacheEntry::Clock;
	if (d <= d.zero())
		return now;

	auto headroom = std::chrono::duration_cast<std::chrono::duration<Rep, Period>>(Clock::time_point::max() - now);
	if (d >= headroom)
		return Clock::time_point::max();
	return now + std::chrono::duration_cast<Clock::duration>(d);
}

} // namespace

std::string MethodURLKeyStrategy::key(HttpRequest& request) const {
	return request.methodName + ":" + request.url;
}

std::string URLOnlyKeyStrategy::key(HttpRequest& request) const {
	return request.url;
}

std::string FullRequestKeyStrategy::key(HttpRequest& request) const {
	Digest digest = Digest::md5();
	digest.update(request.methodName);
	digest.update(request.url);

	std::vector<std::pair<std::string, std::string>> headers;
	headers.reserve(request.headers.size());
	for (const auto& h : request.headers) {
		std::string_view name, value;
		if (util::splitHeader(h, name, value))
			headers.emplace_back(std::string(name), std::string(value));
	}
	std::stable_sort(headers.begin(), headers.end(),
					 [](const auto& a, const auto& b) { return a.first < b.first; });
	for (const auto& [name, value] : headers) {
		digest.update(name);
		digest.update(value);
	}

	std::string body;
	if (request.getBody) {
		if (auto reader = request.getBody())
			body = readBounded(*reader, MaxBodySize);
	} else if (request.body) {
		// The only copy of the body is consumed here, put it back replayable
		request.setBody(readAll(*request.body));
		if (auto reader = request.getBody())
			body = readBounded(*reader, MaxBodySize);
	}
	if (!body.empty() && body.size() < MaxBodySize)
		digest.update(body);

	return digest.hexFinal();
}

std::unique_ptr<CacheKeyStrategy> makeKeyStrategy(CacheKeyStrategyType type) {
	switch (type) {
		case CacheKeyStrategyType::URLOnly:
			return std::make_unique<URLOnlyKeyStrategy>();
		case CacheKeyStrategyType::FullRequest:
			return std::make_unique<FullRequestKeyStrategy>();
		case CacheKeyStrategyType::MethodAndURL:
			break;
	}
	return std::make_unique<MethodURLKeyStrategy>();
}

CacheMiddleware::CacheMiddleware(std::shared_ptr<CacheStore> store, CacheConfig config)
	: store_(std::move(store)), config_(std::move(config)), keyStrategy_(makeKeyStrategy(this->config_.keyStrategy)) {
	if (!this->store_)
		throw std::invalid_argument("CacheMiddleware: null store");
	this->worker_ = std::thread(&CacheMiddleware::worker_loop, this);
}

CacheMiddleware::~CacheMiddleware() {
	{
		std::lock_guard<std::mutex> lk(this->mutex_);
		this->stop_ = true;
	}
	this->cv_.notify_all();

	if (this->worker_.joinable())
		this->worker_.join();
}

Handler CacheMiddleware::wrap(Handler next) {
	return [this, next = std::move(next)](const Context& ctx, HttpRequest& request) -> HttpResponse {
		return this->handle(ctx, request, next);
	};
}

HttpResponse CacheMiddleware::handle(const Context& ctx, HttpRequest& request, const Handler& next) {
	if (!this->config_.enabled || !isCacheableMethod(request) || !this->shouldCache(request))
		return next(ctx, request);

	std::string key = this->keyStrategy_->key(request);

	if (auto entry = this->store_->get(key)) {
		if (this->isFresh(*entry, request)) {
			HttpResponse response;
			response.status = entry->status;
			response.headers = std::move(entry->headers);
			response.body = std::make_shared<StringBodyReader>(std::move(entry->body));
			return response;
		}
		this->store_->remove(key);
	}

	HttpResponse response = next(ctx, request);
	if (response.error || !this->isCacheable(response))
		return response;

	// A body that breaks off is never stored
	std::string body;
	try {
		body = response.body ? readAll(*response.body) : std::string();
	} catch (const RequestError& e) {
		return HttpResponse::failure(e.error());
	}
	response.body = std::make_shared<StringBodyReader>(body);

	auto now = CacheEntry::Clock::now();
	CacheEntry entry;
	entry.key = key;
	entry.status = response.status;
	entry.headers = response.headers;
	entry.body = std::move(body);
	entry.requestURL = request.url;
	entry.createdAt = now;
	entry.lastAccessed = now;
	entry.expiresAt = this->expiration(request, response);

	this->enqueue(std::move(key), std::move(entry));
	return response;
}

void CacheMiddleware::flush() {
	std::unique_lock<std::mutex> lk(this->mutex_);
	this->idle_.wait(lk, [this] { return this->writes_.empty() && !this->writing_; });
}

bool CacheMiddleware::isCacheableMethod(const HttpRequest& request) {
	auto method = request.method();
	return method == HttpRequest::GET || method == HttpRequest::HEAD;
}

bool CacheMiddleware::isCacheableStatus(long status) {
	return std::find(std::begin(kCacheableStatus), std::end(kCacheableStatus), status) != std::end(kCacheableStatus);
}

bool CacheMiddleware::shouldCache(const HttpRequest& request) const {
	const std::string& url = request.url;

	for (const auto& pattern : this->config_.excludePatterns)
		if (url.find(pattern) != std::string::npos) return false;

	if (!this->config_.excludeHosts.empty()) {
		std::string host = util::urlHost(url);
		for (const auto& h : this->config_.excludeHosts)
			if (host == h) return false;
	}

	if (this->config_.includePatterns.empty())
		return true;
	for (const auto& pattern : this->config_.includePatterns)
		if (url.find(pattern) != std::string::npos) return true;
	return false;
}

bool CacheMiddleware::isFresh(const CacheEntry& entry, const HttpRequest& request) const {
	if (entry.expired())
		return false;

	if (this->config_.respectCacheControl) {
		if (util::hasDirective(request.header("Cache-Control"), "no-cache")) return false;
		if (util::hasDirective(request.header("Pragma"), "no-cache")) return false;
	}
	return true;
}

bool CacheMiddleware::isCacheable(const HttpResponse& response) const {
	if (!isCacheableStatus(response.status))
		return false;

	if (this->config_.respectCacheControl) {
		auto cacheControl = response.header("Cache-Control");
		if (util::hasDirective(cacheControl, "no-store") || util::hasDirective(cacheControl, "no-cache") ||
			util::hasDirective(cacheControl, "private"))
			return false;
	}
	return true;
}

CacheEntry::Clock::time_point CacheMiddleware::expiration(const HttpRequest& request, const HttpResponse& response) const {
	auto now = CacheEntry::Clock::now();

	// A negative max-age counts as 0
	if (auto seconds = maxAge(response.header("Cache-Control")))
		return saturatingAdd(now, std::chrono::seconds(*seconds));

	if (auto expires = response.header("Expires")) {
		if (auto at = util::parseHttpDate(*expires))
			return *at;
	}

	return saturatingAdd(now, this->ttlFor(request.url));
}

std::chrono::milliseconds CacheMiddleware::ttlFor(const std::string& url) const {
	if (!this->config_.domainTTLRules.empty()) {
		std::string host = util::urlHost(url);
		for (const auto& rule : this->config_.domainTTLRules)
			if (host == rule.pattern) return rule.ttl;
	}

	if (!this->config_.pathTTLRules.empty()) {
		std::string path = util::urlPath(url);
		for (const auto& rule : this->config_.pathTTLRules)
			if (path.find(rule.pattern) != std::string::npos) return rule.ttl;
	}

	return this->config_.defaultTTL;
}

void CacheMiddleware::enqueue(std::string key, CacheEntry entry) {
	{
		std::lock_guard<std::mutex> lk(this->mutex_);
		this->writes_.emplace(std::move(key), std::move(entry));
	}
	this->cv_.notify_one();
}

void CacheMiddleware::worker_loop() {
	while (1) {
		std::pair<std::string, CacheEntry> job;
		{
			std::unique_lock<std::mutex> lk(this->mutex_);
			this->cv_.wait(lk, [this] { return this->stop_ || !this->writes_.empty(); });

			// Pending writes are drained before stopping
			if (this->writes_.empty())
				break;

			job = std::move(this->writes_.front());
			this->writes_.pop();
			this->writing_ = true;
		}

		try {
			this->store_->set(job.first, job.second);
		} catch (const std::exception& e) {
			Log::warn("cache: write failed for " + job.second.requestURL + ": " + e.what());
		}

		{
			std::lock_guard<std::mutex> lk(this->mutex_);
			this->writing_ = false;
		}
		this->idle_.notify_all();
	}
}

} // namespace http_resilience
