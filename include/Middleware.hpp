#pragma once

#include "Context.hpp"
#include "models.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace http_resilience {

/**
 * A step of the pipeline. A failed call returns an HttpResponse whose error is set.
 */
using Handler = std::function<HttpResponse(const Context& ctx, HttpRequest& request)>;

// The terminal call every chain wraps
using Transport = Handler;

/**
 * Wraps the next handler and returns a new one.
 * Handlers returned by wrap() may refer to the middleware, which must outlive them.
 */
class Middleware {
public:
	virtual ~Middleware() = default;
	virtual Handler wrap(Handler next) = 0;
};

using MiddlewarePtr = std::shared_ptr<Middleware>;
using MiddlewareFn = std::function<Handler(Handler next)>;

// Adapts a plain wrapping function into a Middleware
MiddlewarePtr makeMiddleware(MiddlewareFn fn);

/**
 * Compose middlewares around a terminal handler.
 * middlewares[0] is the outermost: it sees the request first and the response last.
 * Null entries are skipped.
 */
Handler chain(Handler terminal, const std::vector<MiddlewarePtr>& middlewares);

} // namespace http_resilience
