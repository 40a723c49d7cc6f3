#include "CacheMiddleware.hpp"
#include "CircuitBreaker.hpp"
#include "HeadersMiddleware.hpp"
#include "HttpClient.hpp"
#include "Log.hpp"
#include "MemoryCache.hpp"
#include "Retry.hpp"
#include "Stream.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace hr = http_resilience;

void printTime() {
	auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	std::cout << "[" << std::put_time(std::localtime(&now), "%Y-%m-%d %H:%M:%S") << "] ";
}

void printResponse(hr::HttpResponse& response) {
	if (response.error) {
		std::cout << "Error: " << response.error.message << std::endl;
		return;
	}
	std::cout << "Elapsed: " << response.transferInfo.total << "s" << std::endl;
	std::cout << "Status: " << response.status << std::endl;
	std::cout << "Headers:" << std::endl;
	for (const auto& h : response.headers) {
		std::cout << "  " << h << std::endl;
	}
	std::cout << "Body: " << std::endl << response.text() << std::endl;
}

void testGET(const hr::Client& client) {
	std::cout << "GET request..." << std::endl;

	auto response = client.GET("/get").withQuery("hello", "world").perform();
	printResponse(response);
}

void testPOST(const hr::Client& client) {
	std::cout << "POST request..." << std::endl;

	auto response = client.POST("/post").withJson({{"name", "test"}, {"value", "123"}}).perform();
	printResponse(response);
}

void testCache(const hr::Client& client, hr::CacheMiddleware& cache) {
	for (int i = 0; i < 2; ++i) {
		auto start = std::chrono::steady_clock::now();
		auto response = client.GET("/cache/60").perform();
		auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

		printTime();
		std::cout << "Attempt " << i + 1 << " status " << response.status << " in " << elapsed.count() << "ms" << std::endl;

		// The first response reaches the store in the background
		cache.flush();
	}
}

void testTimeout(const hr::Client& client) {
	printTime();
	std::cout << "Request /delay/10 with a 2 second timeout..." << std::endl;

	auto response = client.GET("/delay/10").withTimeout(std::chrono::seconds(2)).perform();

	printTime();
	std::cout << "Completed: " << (response.error ? response.error.message : std::to_string(response.status)) << std::endl;
}

void testCancel(const hr::Client& client) {
	hr::Context ctx = hr::Context().withCancel();

	std::thread canceller([ctx]() {
		std::this_thread::sleep_for(std::chrono::seconds(3));
		ctx.cancel();
	});

	printTime();
	std::cout << "Request /delay/10, cancelled after 3 seconds..." << std::endl;
	auto response = client.GET("/delay/10").perform(ctx);
	canceller.join();

	printTime();
	std::cout << "Completed: " << (response.error ? response.error.message : std::to_string(response.status)) << std::endl;
}

void testRetry(const hr::Client& client, const hr::CircuitBreaker& breaker) {
	printTime();
	std::cout << "Sending request with retry (expecting 503 response)..." << std::endl;

	auto start = std::chrono::steady_clock::now();
	auto response = client.GET("/status/503").perform();
	auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

	printTime();
	std::cout << "Request completed after " << duration.count() / 1000.0 << "s" << std::endl;
	std::cout << "Final status: " << response.status << std::endl;
	std::cout << breaker.toString() << std::endl;
}

void testStream(const hr::Client& client) {
	std::cout << "Streaming NDJSON..." << std::endl;
	client.GET("/stream/3").streamJson(hr::Context(), [](const nlohmann::json& value) {
		std::cout << "  id=" << value.value("id", -1) << " url=" << value.value("url", "") << std::endl;
	});

	std::cout << "Decoding SSE..." << std::endl;
	hr::HttpResponse response;
	response.status = 200;
	response.headers = {"Content-Type: text/event-stream"};
	response.body = std::make_shared<hr::StringBodyReader>(
		"event: greeting\nid: 1\ndata: hello\ndata: world\n\n: keep-alive\ndata: bye\n\n");

	hr::SSEHandler handler;
	handler.onOpen = []() { std::cout << "  open" << std::endl; };
	handler.onEvent = [](const hr::SSEEvent& event) {
		std::cout << "  " << event.event << " #" << event.id << ": " << event.data << std::endl;
	};
	handler.onClose = []() { std::cout << "  close" << std::endl; };
	hr::streamSSE(response, handler);
}

int main() {
	std::cout << "========================================" << std::endl;
	std::cout << "   http_resilience Example" << std::endl;
	std::cout << "========================================" << std::endl << std::endl;

	std::cout << "Note: These examples require internet connection" << std::endl;
	std::cout << "      to reach https://httpbin.org/" << std::endl << std::endl;

	hr::Log::setMinLevel(hr::Log::Level::Debug);

	try {
		hr::ClientConfig config;
		config.baseUrl = "https://httpbin.org";
		config.policy.connTimeout = 10;
		hr::Client client(config);

		hr::CircuitBreakerConfig breakerConfig;
		breakerConfig.failureThreshold = 3;
		breakerConfig.recoveryTimeout = std::chrono::seconds(30);
		auto breaker = std::make_shared<hr::CircuitBreaker>(breakerConfig);

		hr::RetryConfig retryConfig;
		retryConfig.maxRetries = 2;
		retryConfig.baseDelay = std::chrono::milliseconds(500);
		retryConfig.jitterFactor = 0.2;

		auto cache = std::make_shared<hr::CacheMiddleware>(std::make_shared<hr::MemoryCache>());

		// Outermost first: the cache answers before the breaker is consulted
		client.use(std::make_shared<hr::HeadersMiddleware>(hr::HeaderList{{"Accept", "application/json"}}))
			.use(cache)
			.use(std::make_shared<hr::CircuitBreakerMiddleware>(breaker))
			.use(std::make_shared<hr::RetryExecutor>(retryConfig));

		std::cout << "\n[1] Basic GET" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testGET(client);

		std::cout << "\n[2] Basic POST" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testPOST(client);

		std::cout << "\n[3] Cached GET" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testCache(client, *cache);

		std::cout << "\n[4] Timeout" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testTimeout(client);

		std::cout << "\n[5] Cancel Request" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testCancel(client);

		std::cout << "\n[6] Retry Request" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testRetry(client, *breaker);

		std::cout << "\n[7] Streams" << std::endl;
		std::cout << "----------------------------------------" << std::endl;
		testStream(client);

		return 0;
	} catch (const std::exception& e) {
		std::cerr << "Failed with exception: " << e.what() << std::endl;
		return 1;
	}
}
