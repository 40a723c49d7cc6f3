#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace http_resilience {
namespace util {

/**
 * "host" or "host:port" of an absolute URL as parsed by libcurl's URL API.
 * The port is present only when the URL spells it out. Empty when the URL
 * does not parse.
 */
std::string urlHost(std::string_view url);

// Path of an absolute URL without query or fragment, "/" when empty or unparsable
std::string urlPath(std::string_view url);

// Percent-encodes everything but the RFC 3986 unreserved characters
std::string urlEscape(std::string_view s);

/**
 * Parses an HTTP date ("Sun, 06 Nov 1994 08:49:37 GMT" and the other forms
 * curl_getdate accepts). Dates past what system_clock can hold saturate to
 * time_point::max().
 */
std::optional<std::chrono::system_clock::time_point> parseHttpDate(const std::string& value);

} // namespace util
} // namespace http_resilience
