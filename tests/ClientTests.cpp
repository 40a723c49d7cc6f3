#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "CircuitBreaker.hpp"
#include "HttpClient.hpp"
#include "MockTransport.hpp"
#include "Retry.hpp"

using namespace http_resilience;
using namespace http_resilience::testing;
using namespace std::chrono_literals;

namespace {

ClientConfig config(const std::string& baseUrl = "https://api.example.com/v1") {
	ClientConfig c;
	c.baseUrl = baseUrl;
	return c;
}

MiddlewarePtr tag(std::vector<std::string>& trace, const std::string& name) {
	return makeMiddleware([&trace, name](Handler next) -> Handler {
		return [&trace, name, next](const Context& ctx, HttpRequest& request) {
			trace.push_back(name);
			return next(ctx, request);
		};
	});
}

} // namespace

class ClientTests : public ::testing::Test {
protected:
	std::shared_ptr<MockTransport> mock_ = std::make_shared<MockTransport>();
};

TEST_F(ClientTests, ResolvesPaths) {
	Client client(config(), MockTransport::handler(this->mock_));
	EXPECT_EQ(client.resolve("/users"), "https://api.example.com/v1/users");
	EXPECT_EQ(client.resolve("users"), "https://api.example.com/v1/users");
	EXPECT_EQ(client.resolve(""), "https://api.example.com/v1");
	EXPECT_EQ(client.resolve("http://other.example.com/x"), "http://other.example.com/x");

	Client slash(config("https://api.example.com/"), MockTransport::handler(this->mock_));
	EXPECT_EQ(slash.resolve("/users"), "https://api.example.com/users");
}

TEST_F(ClientTests, BuildsRequest) {
	Client client(config(), MockTransport::handler(this->mock_));
	client.withHeader("Authorization", "Bearer abc");

	HttpRequest request = client.GET("/search")
		.withQuery("q", "a b&c")
		.withQuery("page", "2")
		.withHeader("Accept", "application/json")
		.build();

	EXPECT_EQ(request.methodName, "GET");
	EXPECT_EQ(request.url, "https://api.example.com/v1/search?q=a%20b%26c&page=2");
	EXPECT_EQ(request.header("authorization").value_or(""), "Bearer abc");
	EXPECT_EQ(request.header("accept").value_or(""), "application/json");
	EXPECT_EQ(request.header("user-agent").value_or(""), "http_resilience");
	EXPECT_FALSE(request.body);
}

TEST_F(ClientTests, QueryEscapesAllButUnreserved) {
	Client client(config(), MockTransport::handler(this->mock_));
	HttpRequest request = client.GET("/q").withQuery("path", "~a-b_c.d/\xC3\xA9=?").build();
	EXPECT_EQ(request.url, "https://api.example.com/v1/q?path=~a-b_c.d%2F%C3%A9%3D%3F");
}

TEST_F(ClientTests, RequestHeaderOverridesClientHeader) {
	Client client(config(), MockTransport::handler(this->mock_));
	HttpRequest request = client.GET("/").withHeader("user-agent", "custom/1.0").build();

	int userAgents = 0;
	for (const auto& h : request.headers)
		if (util::tolower(h).rfind("user-agent:", 0) == 0) ++userAgents;
	EXPECT_EQ(userAgents, 1);
	EXPECT_EQ(request.header("User-Agent").value_or(""), "custom/1.0");
}

TEST_F(ClientTests, QueryAppendsToExistingQueryBeforeFragment) {
	Client client(config(""), MockTransport::handler(this->mock_));
	HttpRequest request = client.GET("https://x.example.com/p?a=1#top").withQuery("b", "2").build();
	EXPECT_EQ(request.url, "https://x.example.com/p?a=1&b=2#top");
}

TEST_F(ClientTests, JsonBodyIsReplayable) {
	Client client(config(), MockTransport::handler(this->mock_));
	HttpRequest request = client.POST("/items").withJson({{"name", "widget"}}).build();

	EXPECT_EQ(request.methodName, "POST");
	EXPECT_EQ(request.header("Content-Type").value_or(""), "application/json");
	ASSERT_TRUE(request.body);
	ASSERT_TRUE(request.getBody);
	EXPECT_EQ(readAll(*request.body), "{\"name\":\"widget\"}");
	EXPECT_EQ(readAll(*request.getBody()), "{\"name\":\"widget\"}");
}

TEST_F(ClientTests, ExplicitContentTypeIsKept) {
	Client client(config(), MockTransport::handler(this->mock_));
	HttpRequest request = client.PUT("/items/1")
		.withHeader("Content-Type", "application/merge-patch+json")
		.withJson({{"name", "widget"}})
		.build();
	EXPECT_EQ(request.header("Content-Type").value_or(""), "application/merge-patch+json");
}

TEST_F(ClientTests, PerformGoesThroughTransport) {
	this->mock_->push(makeResponse(201, "created"));
	Client client(config(), MockTransport::handler(this->mock_));

	auto response = client.POST("/items").withBody("raw").perform();
	EXPECT_EQ(response.status, 201);
	EXPECT_EQ(response.text(), "created");

	auto seen = this->mock_->seen();
	ASSERT_EQ(seen.size(), 1u);
	EXPECT_EQ(seen[0].method, "POST");
	EXPECT_EQ(seen[0].url, "https://api.example.com/v1/items");
	EXPECT_EQ(seen[0].body, "raw");
}

TEST_F(ClientTests, CustomMethod) {
	Client client(config(), MockTransport::handler(this->mock_));
	client.request("propfind", "/dav").perform();
	EXPECT_EQ(this->mock_->seen().at(0).method, "PROPFIND");
}

TEST_F(ClientTests, ClientMiddlewaresRunBeforeRequestMiddlewares) {
	std::vector<std::string> trace;
	Client client(config(), MockTransport::handler(this->mock_));
	client.use(tag(trace, "client-1")).use(tag(trace, "client-2"));

	client.GET("/").withMiddleware(tag(trace, "request")).perform();

	std::vector<std::string> expected = {"client-1", "client-2", "request"};
	EXPECT_EQ(trace, expected);
	EXPECT_EQ(client.middlewares().size(), 2u);
}

TEST_F(ClientTests, CanceledContextNeverReachesTransport) {
	Client client(config(), MockTransport::handler(this->mock_));
	Context ctx = Context().withCancel();
	ctx.cancel();

	auto response = client.GET("/").perform(ctx);
	EXPECT_EQ(response.error.kind, HttpError::Canceled);
	EXPECT_EQ(this->mock_->calls(), 0);
}

TEST_F(ClientTests, RequestTimeoutBoundsRetryBackoff) {
	this->mock_->push(makeResponse(503));
	Client client(config(), MockTransport::handler(this->mock_));

	RetryConfig retryConfig;
	retryConfig.baseDelay = 5s;
	retryConfig.maxDelay = 5s;
	client.use(std::make_shared<RetryExecutor>(retryConfig));

	auto start = std::chrono::steady_clock::now();
	auto response = client.GET("/").withTimeout(50ms).perform();
	EXPECT_EQ(response.error.kind, HttpError::DeadlineExceeded);
	EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
	EXPECT_EQ(this->mock_->calls(), 1);
}

TEST_F(ClientTests, BreakerAroundRetryCountsOneOutcomePerCall) {
	this->mock_->push(makeResponse(500));

	CircuitBreakerConfig breakerConfig;
	breakerConfig.failureThreshold = 2;
	auto breaker = std::make_shared<CircuitBreaker>(breakerConfig);

	RetryConfig retryConfig;
	retryConfig.maxRetries = 2;
	retryConfig.baseDelay = 1ms;

	Client client(config(), MockTransport::handler(this->mock_));
	client.use(std::make_shared<CircuitBreakerMiddleware>(breaker))
		.use(std::make_shared<RetryExecutor>(retryConfig));

	client.GET("/").perform();
	EXPECT_EQ(this->mock_->calls(), 3);
	EXPECT_EQ(breaker->consecutiveFailures(), 1u);

	client.GET("/").perform();
	EXPECT_EQ(breaker->state(), CircuitState::Open);

	auto rejected = client.GET("/").perform();
	EXPECT_EQ(rejected.error.kind, HttpError::CircuitOpen);
	EXPECT_EQ(this->mock_->calls(), 6);
}

TEST_F(ClientTests, StreamHelpersThrowOnFailedCall) {
	this->mock_->push(makeTransportError("refused"));
	Client client(config(), MockTransport::handler(this->mock_));

	try {
		client.GET("/events").streamLines(Context(), [](std::string_view) {});
		FAIL() << "expected RequestError";
	} catch (const RequestError& e) {
		EXPECT_EQ(e.error().kind, HttpError::Transport);
		EXPECT_STREQ(e.what(), "refused");
	}
}

TEST_F(ClientTests, StreamLinesThroughClient) {
	this->mock_->push(makeResponse(200, "a\nb\nc"));
	Client client(config(), MockTransport::handler(this->mock_));

	std::vector<std::string> lines;
	client.GET("/log").streamLines(Context(), [&](std::string_view line) { lines.emplace_back(line); });

	std::vector<std::string> expected = {"a", "b", "c"};
	EXPECT_EQ(lines, expected);
}

TEST_F(ClientTests, StreamSSERequiresEventStream) {
	this->mock_->push(makeResponse(200, "data: x\n\n", {"Content-Type: application/json"}));
	Client client(config(), MockTransport::handler(this->mock_));

	SSEHandler handler;
	EXPECT_THROW(client.GET("/events").streamSSE(Context(), handler), StreamDecodeError);
}

TEST_F(ClientTests, StreamSSEThroughClient) {
	this->mock_->push(makeResponse(200, "event: tick\ndata: 1\n\n", {"Content-Type: text/event-stream; charset=utf-8"}));
	Client client(config(), MockTransport::handler(this->mock_));

	std::vector<SSEEvent> events;
	SSEHandler handler;
	handler.onEvent = [&](const SSEEvent& e) { events.push_back(e); };
	client.GET("/events").streamSSE(Context(), handler);

	ASSERT_EQ(events.size(), 1u);
	EXPECT_EQ(events[0].event, "tick");
}

TEST_F(ClientTests, StreamIntoThroughClient) {
	this->mock_->push(makeResponse(200, "1\n2\n3\n"));
	Client client(config(), MockTransport::handler(this->mock_));

	int sum = 0;
	client.GET("/numbers").streamInto<int>(Context(), [&](int n) { sum += n; });
	EXPECT_EQ(sum, 6);
}
