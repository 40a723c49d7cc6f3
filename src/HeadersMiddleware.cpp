#include "HeadersMiddleware.hpp"

#include <algorithm>

namespace http_resilience {

HeadersMiddleware::HeadersMiddleware(HeadersConfig config) : config_(std::move(config)) {}

HeadersMiddleware::HeadersMiddleware(HeaderList headers)
	: config_(HeadersConfig{std::move(headers), {}, false}) {}

Handler HeadersMiddleware::wrap(Handler next) {
	return [this, next = std::move(next)](const Context& ctx, HttpRequest& request) -> HttpResponse {
		this->apply(request);
		return next(ctx, request);
	};
}

void HeadersMiddleware::apply(HttpRequest& request) const {
	for (const auto& [name, value] : this->config_.headers)
		this->set(request, name, value);

	for (const auto& header : this->config_.conditionalHeaders) {
		if (header.condition && header.condition(request))
			this->set(request, header.name, header.value);
	}
}

void HeadersMiddleware::set(HttpRequest& request, const std::string& name, const std::string& value) const {
	// An empty value counts as absent
	if (!this->config_.overwriteExisting && !request.header(name).value_or("").empty())
		return;

	auto& headers = request.headers;
	headers.erase(std::remove_if(headers.begin(), headers.end(), [&](const std::string& h) {
		std::string_view k, v;
		return util::splitHeader(h, k, v) && util::iequals(k, name);
	}), headers.end());
	headers.push_back(name + ": " + value);
}

} // namespace http_resilience
