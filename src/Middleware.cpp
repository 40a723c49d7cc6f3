#include "Middleware.hpp"

#include <stdexcept>

namespace http_resilience {

namespace {

class FunctionMiddleware : public Middleware {
public:
	explicit FunctionMiddleware(MiddlewareFn fn) : fn_(std::move(fn)) {}

	Handler wrap(Handler next) override {
		return this->fn_(std::move(next));
	}

private:
	MiddlewareFn fn_;
};

} // namespace

MiddlewarePtr makeMiddleware(MiddlewareFn fn) {
	if (!fn) throw std::invalid_argument("makeMiddleware: empty function");
	return std::make_shared<FunctionMiddleware>(std::move(fn));
}

Handler chain(Handler terminal, const std::vector<MiddlewarePtr>& middlewares) {
	Handler handler = std::move(terminal);

	for (auto it = middlewares.rbegin(); it != middlewares.rend(); ++it) {
		if (*it)
			handler = (*it)->wrap(std::move(handler));
	}

	return handler;
}

} // namespace http_resilience
