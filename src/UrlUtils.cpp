#include "UrlUtils.hpp"

#include <ctime>
#include <memory>
#include <new>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace http_resilience {
namespace util {

namespace {

using curl_url_ptr = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;
using curl_string_ptr = std::unique_ptr<char, decltype(&curl_free)>;

curl_url_ptr parse(std::string_view url) {
	curl_url_ptr handle(curl_url(), &curl_url_cleanup);
	if (!handle)
		return handle;

	std::string copy(url);
	if (curl_url_set(handle.get(), CURLUPART_URL, copy.c_str(), CURLU_NON_SUPPORT_SCHEME) != CURLUE_OK)
		handle.reset();
	return handle;
}

std::optional<std::string> part(CURLU* handle, CURLUPart which) {
	char* raw = nullptr;
	if (curl_url_get(handle, which, &raw, 0) != CURLUE_OK || !raw)
		return std::nullopt;
	curl_string_ptr owned(raw, &curl_free);
	return std::string(owned.get());
}

} // namespace

std::string urlHost(std::string_view url) {
	auto handle = parse(url);
	if (!handle)
		return {};

	auto host = part(handle.get(), CURLUPART_HOST);
	if (!host)
		return {};
	// CURLUE_NO_PORT when the URL does not carry one
	if (auto port = part(handle.get(), CURLUPART_PORT))
		return *host + ":" + *port;
	return *host;
}

std::string urlPath(std::string_view url) {
	auto handle = parse(url);
	if (!handle)
		return "/";

	auto path = part(handle.get(), CURLUPART_PATH);
	if (!path || path->empty())
		return "/";
	return *path;
}

std::string urlEscape(std::string_view s) {
	if (s.empty())
		return {};

	char* raw = curl_easy_escape(nullptr, s.data(), static_cast<int>(s.size()));
	if (!raw)
		throw std::bad_alloc();
	curl_string_ptr owned(raw, &curl_free);
	return std::string(owned.get());
}

std::optional<std::chrono::system_clock::time_point> parseHttpDate(const std::string& value) {
	using Clock = std::chrono::system_clock;

	std::time_t t = curl_getdate(value.c_str(), nullptr);
	if (t == static_cast<std::time_t>(-1))
		return std::nullopt;

	// system_clock counts in a finer unit than seconds, far dates overflow it
	constexpr auto maxSeconds = std::chrono::duration_cast<std::chrono::seconds>(Clock::time_point::max().time_since_epoch()).count();
	constexpr auto minSeconds = std::chrono::duration_cast<std::chrono::seconds>(Clock::time_point::min().time_since_epoch()).count();
	if (static_cast<long long>(t) >= maxSeconds)
		return Clock::time_point::max();
	if (static_cast<long long>(t) <= minSeconds)
		return Clock::time_point::min();
	return Clock::from_time_t(t);
}

} // namespace util
} // namespace http_resilience
