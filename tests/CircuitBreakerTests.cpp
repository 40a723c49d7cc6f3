#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "CircuitBreaker.hpp"
#include "MockTransport.hpp"

using namespace http_resilience;
using namespace http_resilience::testing;

namespace {

CircuitBreakerConfig fastConfig(uint32_t threshold = 3, uint32_t probes = 2) {
	CircuitBreakerConfig config;
	config.failureThreshold = threshold;
	config.recoveryTimeout = std::chrono::milliseconds(50);
	config.halfOpenMaxCalls = probes;
	return config;
}

void failTimes(CircuitBreaker& breaker, int n) {
	for (int i = 0; i < n; ++i) {
		ASSERT_TRUE(breaker.admit());
		breaker.recordOutcome(true);
	}
}

} // namespace

TEST(CircuitBreakerTests, DefaultsReplaceZeroValues) {
	CircuitBreakerConfig config;
	config.failureThreshold = 0;
	config.recoveryTimeout = std::chrono::milliseconds(0);
	config.halfOpenMaxCalls = 0;

	CircuitBreaker breaker(config);
	EXPECT_EQ(breaker.config().failureThreshold, 5u);
	EXPECT_EQ(breaker.config().recoveryTimeout, std::chrono::milliseconds(60000));
	EXPECT_EQ(breaker.config().halfOpenMaxCalls, 3u);
	EXPECT_EQ(breaker.state(), CircuitState::Closed);
}

TEST(CircuitBreakerTests, OpensAfterConsecutiveFailures) {
	CircuitBreaker breaker(fastConfig(3));

	failTimes(breaker, 2);
	EXPECT_EQ(breaker.state(), CircuitState::Closed);
	EXPECT_EQ(breaker.consecutiveFailures(), 2u);

	failTimes(breaker, 1);
	EXPECT_EQ(breaker.state(), CircuitState::Open);
	EXPECT_TRUE(breaker.isOpen());

	std::string reason;
	EXPECT_FALSE(breaker.admit(&reason));
	EXPECT_EQ(reason, "circuit breaker is open - request rejected");
}

TEST(CircuitBreakerTests, SuccessResetsFailureCount) {
	CircuitBreaker breaker(fastConfig(3));

	failTimes(breaker, 2);
	ASSERT_TRUE(breaker.admit());
	breaker.recordOutcome(false);
	EXPECT_EQ(breaker.consecutiveFailures(), 0u);

	failTimes(breaker, 2);
	EXPECT_EQ(breaker.state(), CircuitState::Closed);
}

TEST(CircuitBreakerTests, HalfOpenAfterRecoveryTimeoutThenCloses) {
	CircuitBreaker breaker(fastConfig(1));
	failTimes(breaker, 1);
	ASSERT_EQ(breaker.state(), CircuitState::Open);

	std::this_thread::sleep_for(std::chrono::milliseconds(80));

	EXPECT_TRUE(breaker.admit());
	EXPECT_EQ(breaker.state(), CircuitState::HalfOpen);
	EXPECT_EQ(breaker.halfOpenProbesUsed(), 1u);

	breaker.recordOutcome(false);
	EXPECT_EQ(breaker.state(), CircuitState::Closed);
	EXPECT_EQ(breaker.consecutiveFailures(), 0u);
	EXPECT_EQ(breaker.halfOpenProbesUsed(), 0u);
}

TEST(CircuitBreakerTests, LastTransitionAtMovesOnlyOnStateChange) {
	CircuitBreaker breaker(fastConfig(2));
	auto created = breaker.lastTransitionAt();

	failTimes(breaker, 1);
	EXPECT_TRUE(breaker.lastTransitionAt() == created);

	std::this_thread::sleep_for(std::chrono::milliseconds(5));
	auto beforeOpen = CircuitBreaker::Clock::now();
	failTimes(breaker, 1);
	ASSERT_EQ(breaker.state(), CircuitState::Open);
	auto opened = breaker.lastTransitionAt();
	EXPECT_GE(opened, beforeOpen);

	// Rejections are not transitions
	EXPECT_FALSE(breaker.admit());
	EXPECT_TRUE(breaker.lastTransitionAt() == opened);

	std::this_thread::sleep_for(std::chrono::milliseconds(80));
	ASSERT_TRUE(breaker.admit());
	EXPECT_GT(breaker.lastTransitionAt(), opened);
}

TEST(CircuitBreakerTests, FailedProbeReopens) {
	CircuitBreaker breaker(fastConfig(1));
	failTimes(breaker, 1);
	std::this_thread::sleep_for(std::chrono::milliseconds(80));

	ASSERT_TRUE(breaker.admit());
	breaker.recordOutcome(true);
	EXPECT_EQ(breaker.state(), CircuitState::Open);

	// The recovery timeout restarts from the failed probe
	EXPECT_FALSE(breaker.admit());
}

TEST(CircuitBreakerTests, HalfOpenAdmitsAtMostMaxCalls) {
	CircuitBreaker breaker(fastConfig(1, 2));
	failTimes(breaker, 1);
	std::this_thread::sleep_for(std::chrono::milliseconds(80));

	EXPECT_TRUE(breaker.admit());
	EXPECT_TRUE(breaker.admit());

	std::string reason;
	EXPECT_FALSE(breaker.admit(&reason));
	EXPECT_EQ(reason, "circuit breaker is half-open and maximum test requests reached");
	EXPECT_EQ(breaker.halfOpenProbesUsed(), 2u);
}

TEST(CircuitBreakerTests, ConcurrentProbesNeverExceedBudget) {
	CircuitBreaker breaker(fastConfig(1, 3));
	failTimes(breaker, 1);
	std::this_thread::sleep_for(std::chrono::milliseconds(80));

	std::atomic<int> admitted{0};
	std::vector<std::thread> threads;
	for (int i = 0; i < 16; ++i) {
		threads.emplace_back([&] {
			if (breaker.admit()) ++admitted;
		});
	}
	for (auto& t : threads) t.join();

	EXPECT_EQ(admitted.load(), 3);
	EXPECT_EQ(breaker.state(), CircuitState::HalfOpen);
}

TEST(CircuitBreakerTests, ConcurrentFailuresAreAllCounted) {
	CircuitBreaker breaker(fastConfig(1000));

	std::vector<std::thread> threads;
	for (int i = 0; i < 8; ++i) {
		threads.emplace_back([&] {
			for (int j = 0; j < 50; ++j) {
				if (breaker.admit()) breaker.recordOutcome(true);
			}
		});
	}
	for (auto& t : threads) t.join();

	EXPECT_EQ(breaker.consecutiveFailures(), 400u);
	EXPECT_EQ(breaker.state(), CircuitState::Closed);
}

TEST(CircuitBreakerTests, ObserverSeesTransitionsAndMayReenter) {
	std::mutex m;
	std::vector<std::pair<CircuitState, CircuitState>> transitions;
	CircuitBreaker* self = nullptr;

	CircuitBreakerConfig config = fastConfig(1);
	config.onStateChange = [&](CircuitState from, CircuitState to) {
		// Reading the breaker from the observer must not deadlock
		(void)self->state();
		std::lock_guard<std::mutex> lk(m);
		transitions.emplace_back(from, to);
	};

	CircuitBreaker breaker(config);
	self = &breaker;

	failTimes(breaker, 1);
	std::this_thread::sleep_for(std::chrono::milliseconds(80));
	ASSERT_TRUE(breaker.admit());
	breaker.recordOutcome(false);

	std::vector<std::pair<CircuitState, CircuitState>> expected = {
		{CircuitState::Closed, CircuitState::Open},
		{CircuitState::Open, CircuitState::HalfOpen},
		{CircuitState::HalfOpen, CircuitState::Closed},
	};
	EXPECT_EQ(transitions, expected);
}

TEST(CircuitBreakerTests, ResetForcesClosed) {
	CircuitBreaker breaker(fastConfig(2));
	failTimes(breaker, 2);
	ASSERT_EQ(breaker.state(), CircuitState::Open);

	breaker.reset();
	EXPECT_EQ(breaker.state(), CircuitState::Closed);
	EXPECT_EQ(breaker.consecutiveFailures(), 0u);
	EXPECT_TRUE(breaker.admit());
}

TEST(CircuitBreakerTests, DefaultPredicate) {
	CircuitBreaker breaker;
	EXPECT_FALSE(breaker.isFailure(makeResponse(200)));
	EXPECT_FALSE(breaker.isFailure(makeResponse(404)));
	EXPECT_TRUE(breaker.isFailure(makeResponse(500)));
	EXPECT_TRUE(breaker.isFailure(makeResponse(503)));
	EXPECT_TRUE(breaker.isFailure(makeTransportError()));
	EXPECT_TRUE(breaker.isFailure(HttpResponse::failure(HttpError::make(HttpError::Canceled, "context canceled"))));
}

TEST(CircuitBreakerTests, CustomPredicate) {
	CircuitBreakerConfig config = fastConfig(1);
	config.errorPredicate = [](const HttpResponse& r) { return r.status == 429; };
	CircuitBreaker breaker(config);

	EXPECT_FALSE(breaker.isFailure(makeResponse(500)));
	EXPECT_TRUE(breaker.isFailure(makeResponse(429)));
}

TEST(CircuitBreakerTests, ToString) {
	CircuitBreaker breaker(fastConfig(4));
	failTimes(breaker, 1);
	EXPECT_EQ(breaker.toString(), "CircuitBreaker [State: CLOSED, Consecutive Errors: 1/4]");
}

TEST(CircuitBreakerTests, MiddlewareFailsFastWhenOpen) {
	auto mock = std::make_shared<MockTransport>();
	mock->push(makeResponse(503));

	CircuitBreakerMiddleware middleware(fastConfig(2));
	Handler handler = middleware.wrap(MockTransport::handler(mock));

	HttpRequest request;
	request.url = "https://api.example.com/";
	EXPECT_EQ(handler(Context(), request).status, 503);
	EXPECT_EQ(handler(Context(), request).status, 503);
	EXPECT_EQ(mock->calls(), 2);

	auto rejected = handler(Context(), request);
	EXPECT_EQ(rejected.error.kind, HttpError::CircuitOpen);
	EXPECT_EQ(rejected.status, 0);
	EXPECT_EQ(mock->calls(), 2);
}

TEST(CircuitBreakerTests, MiddlewareCountsThrownExceptions) {
	CircuitBreakerMiddleware middleware(fastConfig(1));
	Handler handler = middleware.wrap([](const Context&, HttpRequest&) -> HttpResponse {
		throw std::runtime_error("handler blew up");
	});

	HttpRequest request;
	EXPECT_THROW(handler(Context(), request), std::runtime_error);
	EXPECT_EQ(middleware.breaker()->state(), CircuitState::Open);
}

TEST(CircuitBreakerTests, SharedBreakerAcrossMiddlewares) {
	auto breaker = std::make_shared<CircuitBreaker>(fastConfig(1));
	CircuitBreakerMiddleware a(breaker);
	CircuitBreakerMiddleware b(breaker);

	Handler failing = a.wrap([](const Context&, HttpRequest&) { return makeResponse(500); });
	Handler healthy = b.wrap([](const Context&, HttpRequest&) { return makeResponse(200); });

	HttpRequest request;
	failing(Context(), request);
	EXPECT_EQ(healthy(Context(), request).error.kind, HttpError::CircuitOpen);
}
