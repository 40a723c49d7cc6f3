#pragma once

#include "Middleware.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace http_resilience {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct ConditionalHeader {
	std::string name;
	std::string value;
	// Set the header only for requests this accepts; a null condition never matches
	std::function<bool(const HttpRequest&)> condition;
};

struct HeadersConfig {
	HeaderList headers;								   // added to every request, in order
	std::vector<ConditionalHeader> conditionalHeaders; // applied after the static ones
	bool overwriteExisting = false;					   // replace a header the request already carries
};

/**
 * Adds configured headers to each request before passing it on.
 * Without overwriteExisting a header is only set when the request has no
 * non-empty value for it. Setting replaces every header of the same name.
 */
class HeadersMiddleware : public Middleware {
public:
	explicit HeadersMiddleware(HeadersConfig config = HeadersConfig());
	explicit HeadersMiddleware(HeaderList headers);

	Handler wrap(Handler next) override;

	// Applies the configured headers to request
	void apply(HttpRequest& request) const;

	const HeadersConfig& config() const { return this->config_; }

private:
	void set(HttpRequest& request, const std::string& name, const std::string& value) const;

	const HeadersConfig config_;
};

} // namespace http_resilience
