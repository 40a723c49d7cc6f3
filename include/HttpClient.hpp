#pragma once

#include "Context.hpp"
#include "Middleware.hpp"
#include "Stream.hpp"
#include "models.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace http_resilience {

/**
 * One libcurl transfer driven through a private multi handle on the calling thread.
 *
 * perform() returns as soon as the final response headers are in; the body is
 * then pulled through read(), which runs the transfer only as far as the reader
 * needs. When the reader falls behind, the write callback pauses the transfer
 * (CURL_WRITEFUNC_PAUSE) until read() has drained what is buffered.
 *
 * The context aborts the transfer from the progress callback, its deadline
 * bounds CURLOPT_TIMEOUT_MS.
 */
class HttpTransfer {
public:
	HttpTransfer(Context ctx, RequestPolicy policy);
	~HttpTransfer();

	// Not copyable, not movable: curl keeps pointers to this
	HttpTransfer(const HttpTransfer&) = delete;
	HttpTransfer& operator=(const HttpTransfer&) = delete;

	HttpResponse perform(HttpRequest& request);

	// Next body bytes, 0 at the end of the body; throws RequestError when the transfer fails
	size_t read(char* buf, size_t len);

private:
	void setup(HttpRequest& request);
	void pump();
	HttpError transfer_error() const;
	void finalize_transfer(HttpResponse& response);

	static size_t body_cb(void* ptr, size_t size, size_t nmemb, void* data);
	static size_t header_cb(void* ptr, size_t size, size_t nmemb, void* data);
	static int progress_cb(void* data, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);

	// Buffered body bytes above which the transfer is paused
	static constexpr size_t HIGH_WATER = 64 * 1024;
	static constexpr int POLL_MS = 50;

	Context ctx_;
	RequestPolicy policy_;
	std::string method_;
	std::string url_;

	CURLM* curlMulti = NULL;
	CURL* curlEasy = NULL;
	struct curl_slist* headers_ = NULL;
	char errorBuffer_[CURL_ERROR_SIZE] = {0};
	bool attached_ = false;

	std::string requestBody_;
	std::vector<std::string> responseHeaders_;
	std::string pending_;
	size_t pendingPos_ = 0;

	bool headersDone_ = false;
	bool paused_ = false;
	bool done_ = false;
	CURLcode result_ = CURLE_OK;
};

// Response body served by a live transfer; keeps it alive until the body is released
class TransferBodyReader : public BodyReader {
public:
	explicit TransferBodyReader(std::shared_ptr<HttpTransfer> transfer) : transfer_(std::move(transfer)) {}

	size_t read(char* buf, size_t len) override { return this->transfer_->read(buf, len); }

private:
	std::shared_ptr<HttpTransfer> transfer_;
};

/**
 * The default Transport: performs the request with libcurl on the calling thread.
 * The returned body streams from the network as it is read.
 */
class CurlTransport {
public:
	explicit CurlTransport(RequestPolicy policy = RequestPolicy()) : policy_(std::move(policy)) {}

	HttpResponse operator()(const Context& ctx, HttpRequest& request) const;

	const RequestPolicy& policy() const { return this->policy_; }

private:
	RequestPolicy policy_;
};

struct ClientConfig {
	std::string baseUrl;										 // prefixed to relative paths
	std::vector<std::string> headers = {"User-Agent: http_resilience"}; // sent with every request
	RequestPolicy policy;										 // used by the default transport
};

class Request;

/**
 * Entry point: holds the transport, default headers and the client-level
 * middlewares every request runs through.
 */
class Client {
public:
	explicit Client(ClientConfig config = ClientConfig());
	Client(ClientConfig config, Transport transport);

	// Appended middlewares run inside the ones added before them
	Client& use(MiddlewarePtr middleware);
	Client& withHeader(const std::string& name, const std::string& value);

#define HTTP_METHOD(name) Request name(const std::string& path) const;
	HTTP_METHODS
#undef HTTP_METHOD

	Request request(const std::string& method, const std::string& path) const;

	// Runs request through client middlewares, then extra, then the transport
	HttpResponse execute(const Context& ctx, HttpRequest& request,
						 const std::vector<MiddlewarePtr>& extra = {}) const;

	std::string resolve(const std::string& path) const;

	const ClientConfig& config() const { return this->config_; }
	const std::vector<MiddlewarePtr>& middlewares() const { return this->middlewares_; }

private:
	ClientConfig config_;
	Transport transport_;
	std::vector<MiddlewarePtr> middlewares_;
};

/**
 * Builder for one call. The Client must outlive it.
 */
class Request {
public:
	Request(const Client& client, std::string method, std::string url);

	// Replaces a header of the same name
	Request& withHeader(const std::string& name, const std::string& value);
	Request& withQuery(const std::string& key, const std::string& value);
	Request& withBody(std::string body);
	// Serialized body, Content-Type defaults to application/json
	Request& withJson(const nlohmann::json& body);
	Request& withMiddleware(MiddlewarePtr middleware);
	Request& withTimeout(std::chrono::milliseconds timeout);

	HttpRequest build() const;

	HttpResponse perform(const Context& ctx = Context()) const;

	// Stream helpers throw RequestError when the call fails
	void stream(const Context& ctx, const ChunkHandler& handler, const StreamOptions& options = StreamOptions()) const;
	void streamLines(const Context& ctx, const LineHandler& handler, const StreamOptions& options = StreamOptions()) const;
	void streamJson(const Context& ctx, const JsonHandler& handler, const StreamOptions& options = StreamOptions()) const;

	template <typename T, typename Fn>
	void streamInto(const Context& ctx, Fn&& handler, const StreamOptions& options = StreamOptions()) const {
		HttpResponse response = this->performOrThrow(ctx);
		http_resilience::streamInto<T>(response, std::forward<Fn>(handler), options);
	}

	// Requires a text/event-stream response
	void streamSSE(const Context& ctx, const SSEHandler& handler, const StreamOptions& options = StreamOptions()) const;

private:
	HttpResponse performOrThrow(const Context& ctx) const;

	const Client* client_;
	std::string method_;
	std::string url_;
	std::vector<std::string> headers_;
	std::vector<std::pair<std::string, std::string>> query_;
	std::optional<std::string> body_;
	std::vector<MiddlewarePtr> middlewares_;
	std::optional<std::chrono::milliseconds> timeout_;
};

} // namespace http_resilience
