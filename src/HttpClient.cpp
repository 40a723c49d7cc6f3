#include "HttpClient.hpp"
#include "Log.hpp"
#include "UrlUtils.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>

namespace http_resilience {

inline static float current_time() {
	return std::chrono::duration<float>(
		std::chrono::system_clock::now().time_since_epoch()).count();
}

// HttpTransfer implementation
HttpTransfer::HttpTransfer(Context ctx, RequestPolicy policy)
	: ctx_(std::move(ctx)), policy_(std::move(policy)) {
	static std::once_flag inited;

	std::call_once(inited, []() {
		auto rc = curl_global_init(CURL_GLOBAL_DEFAULT);
		if (rc != CURLE_OK) throw std::runtime_error("curl_global_init failed");
		std::atexit([]{ curl_global_cleanup(); });
	});

	this->curlMulti = curl_multi_init();
	if (!this->curlMulti) throw std::runtime_error("curl_multi_init failed");

	this->curlEasy = curl_easy_init();
	if (!this->curlEasy) {
		curl_multi_cleanup(this->curlMulti);
		throw std::runtime_error("curl_easy_init failed");
	}
}

HttpTransfer::~HttpTransfer() {
	if (this->attached_)
		curl_multi_remove_handle(this->curlMulti, this->curlEasy);
	curl_easy_cleanup(this->curlEasy);
	curl_multi_cleanup(this->curlMulti);
	curl_slist_free_all(this->headers_);
}

void HttpTransfer::setup(HttpRequest& request) {
	this->method_ = request.methodName;
	this->url_ = request.url;

	curl_easy_setopt(this->curlEasy, CURLOPT_URL, this->url_.c_str());
	curl_easy_setopt(this->curlEasy, CURLOPT_ERRORBUFFER, this->errorBuffer_);
	curl_easy_setopt(this->curlEasy, CURLOPT_TCP_KEEPALIVE, 1L);
	curl_easy_setopt(this->curlEasy, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(this->curlEasy, CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);
	curl_easy_setopt(this->curlEasy, CURLOPT_FOLLOWLOCATION, this->policy_.followRedirects ? 1L : 0L);

	// The tighter of the policy timeout and the context deadline
	long timeoutMs = this->policy_.timeout > 0 ? static_cast<long>(this->policy_.timeout * 1000) : 0;
	if (auto deadline = this->ctx_.deadline()) {
		auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Context::Clock::now()).count();
		remaining = std::max<long long>(remaining, 1);
		if (timeoutMs == 0 || remaining < timeoutMs)
			timeoutMs = static_cast<long>(remaining);
	}
	if (timeoutMs > 0)
		curl_easy_setopt(this->curlEasy, CURLOPT_TIMEOUT_MS, timeoutMs);
	if (this->policy_.connTimeout > 0)
		curl_easy_setopt(this->curlEasy, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(this->policy_.connTimeout * 1000));
	if (this->policy_.lowSpeedLimit && this->policy_.lowSpeedTime) {
		curl_easy_setopt(this->curlEasy, CURLOPT_LOW_SPEED_TIME, static_cast<long>(this->policy_.lowSpeedTime));
		curl_easy_setopt(this->curlEasy, CURLOPT_LOW_SPEED_LIMIT, static_cast<long>(this->policy_.lowSpeedLimit));
	}

	for (const auto& header : request.headers) {
		this->headers_ = curl_slist_append(this->headers_, header.c_str());
	}
	curl_easy_setopt(this->curlEasy, CURLOPT_HTTPHEADER, this->headers_);

	if (request.body)
		this->requestBody_ = readAll(*request.body);

	switch (request.method()) {
		case HttpRequest::HEAD: {
			curl_easy_setopt(this->curlEasy, CURLOPT_NOBODY, 1L);
			break;
		}
		case HttpRequest::GET: {
			curl_easy_setopt(this->curlEasy, CURLOPT_HTTPGET, 1L);
			break;
		}
		case HttpRequest::POST: {
			curl_easy_setopt(this->curlEasy, CURLOPT_POST, 1L);
			curl_easy_setopt(this->curlEasy, CURLOPT_POSTFIELDS, this->requestBody_.c_str());
			curl_easy_setopt(this->curlEasy, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(this->requestBody_.size()));
			break;
		}
		default: {
			curl_easy_setopt(this->curlEasy, CURLOPT_CUSTOMREQUEST, util::toupper(this->method_).c_str());
			if (this->requestBody_.size()) {
				curl_easy_setopt(this->curlEasy, CURLOPT_POSTFIELDS, this->requestBody_.c_str());
				curl_easy_setopt(this->curlEasy, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(this->requestBody_.size()));
			}
		}
	}

	curl_easy_setopt(this->curlEasy, CURLOPT_WRITEFUNCTION, HttpTransfer::body_cb);
	curl_easy_setopt(this->curlEasy, CURLOPT_WRITEDATA, this);
	curl_easy_setopt(this->curlEasy, CURLOPT_HEADERFUNCTION, HttpTransfer::header_cb);
	curl_easy_setopt(this->curlEasy, CURLOPT_HEADERDATA, this);
	curl_easy_setopt(this->curlEasy, CURLOPT_NOPROGRESS, 0L);
	curl_easy_setopt(this->curlEasy, CURLOPT_XFERINFOFUNCTION, HttpTransfer::progress_cb);
	curl_easy_setopt(this->curlEasy, CURLOPT_XFERINFODATA, this);
}

HttpResponse HttpTransfer::perform(HttpRequest& request) {
	if (this->ctx_.done()) [[unlikely]]
		return HttpResponse::failure(this->ctx_.err());

	this->setup(request);

	CURLMcode mc = curl_multi_add_handle(this->curlMulti, this->curlEasy);
	if (mc != CURLM_OK)
		throw std::runtime_error(std::string("curl_multi_add_handle failed: ") + curl_multi_strerror(mc));
	this->attached_ = true;

	// Run until the final response's headers are in, the body is left to read()
	while (!this->headersDone_ && !this->done_) {
		if (this->ctx_.done()) [[unlikely]]
			return HttpResponse::failure(this->ctx_.err());
		this->pump();
	}

	if (this->done_ && this->result_ != CURLE_OK) {
		HttpError error = this->transfer_error();
		if (error.kind == HttpError::Transport)
			Log::warn(this->method_ + " " + this->url_ + " failed: " + error.message);
		return HttpResponse::failure(std::move(error));
	}

	HttpResponse response;
	this->finalize_transfer(response);
	return response;
}

size_t HttpTransfer::read(char* buf, size_t len) {
	while (1) {
		if (this->pendingPos_ < this->pending_.size()) {
			size_t n = std::min(len, this->pending_.size() - this->pendingPos_);
			std::memcpy(buf, this->pending_.data() + this->pendingPos_, n);
			this->pendingPos_ += n;
			return n;
		}
		this->pending_.clear();
		this->pendingPos_ = 0;

		// Everything buffered is consumed, let curl deliver what it held back
		if (this->paused_) {
			this->paused_ = false;
			CURLcode rc = curl_easy_pause(this->curlEasy, CURLPAUSE_CONT);
			if (rc != CURLE_OK) [[unlikely]] {
				this->result_ = rc;
				this->done_ = true;
			}
			continue;
		}

		if (this->done_) {
			if (this->result_ != CURLE_OK)
				throw RequestError(this->transfer_error());
			return 0;
		}
		if (this->ctx_.done()) [[unlikely]]
			throw RequestError(this->ctx_.err());

		this->pump();
	}
}

void HttpTransfer::pump() {
	const bool hadHeaders = this->headersDone_;
	int still_running = 0;
	CURLMcode mc;
	do {
		mc = curl_multi_perform(this->curlMulti, &still_running);
	} while (mc == CURLM_CALL_MULTI_PERFORM);
	if (mc != CURLM_OK)
		throw std::runtime_error(std::string("curl_multi_perform failed: ") + curl_multi_strerror(mc));

	// Harvest the result
	CURLMsg* msg;
	do {
		int msgq = 0;
		msg = curl_multi_info_read(this->curlMulti, &msgq);
		if (msg && (msg->msg == CURLMSG_DONE)) {
			this->result_ = msg->data.result;
			this->done_ = true;
		}
	} while (msg);

	if (this->done_ || still_running == 0) {
		this->done_ = true;
		return;
	}
	// Something for the caller already, no need to wait
	if (this->pendingPos_ < this->pending_.size() || this->headersDone_ != hadHeaders)
		return;

	long t = -1;
	curl_multi_timeout(this->curlMulti, &t);

	int poll_timeout;
	if (t < 0)
		poll_timeout = POLL_MS;
	else
		poll_timeout = (int)std::min<long>(t, POLL_MS);

	curl_multi_poll(this->curlMulti, nullptr, 0, poll_timeout, NULL);
}

HttpError HttpTransfer::transfer_error() const {
	// A callback abort or a timeout hit by the context deadline is the context's error
	if ((this->result_ == CURLE_ABORTED_BY_CALLBACK || this->result_ == CURLE_OPERATION_TIMEDOUT) && this->ctx_.done())
		return this->ctx_.err();

	HttpError error;
	error.kind = HttpError::Transport;
	error.curlCode = this->result_;
	error.message = this->errorBuffer_[0] ? this->errorBuffer_ : curl_easy_strerror(this->result_);
	return error;
}

void HttpTransfer::finalize_transfer(HttpResponse& response) {
	curl_easy_getinfo(this->curlEasy, CURLINFO_RESPONSE_CODE, &response.status);

	curl_off_t connect = 0, appConnect = 0, startTransfer = 0, total = 0;
	curl_easy_getinfo(this->curlEasy, CURLINFO_CONNECT_TIME_T, &connect);
	curl_easy_getinfo(this->curlEasy, CURLINFO_APPCONNECT_TIME_T, &appConnect);
	curl_easy_getinfo(this->curlEasy, CURLINFO_STARTTRANSFER_TIME_T, &startTransfer);
	curl_easy_getinfo(this->curlEasy, CURLINFO_TOTAL_TIME_T, &total);

	// total is the time to the headers unless the transfer already ended
	constexpr float us2s = 1e-6f;
	response.transferInfo.connect = connect * us2s;
	response.transferInfo.appConnect = appConnect * us2s;
	response.transferInfo.startTransfer = startTransfer * us2s;
	response.transferInfo.total = total * us2s;
	response.transferInfo.completeAt = current_time();

	response.headers = this->responseHeaders_;
}

size_t HttpTransfer::body_cb(void* ptr, size_t size, size_t nmemb, void* data) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);
	const size_t len = size * nmemb;

	// The reader is behind, curl keeps this chunk and hands it over again after CURLPAUSE_CONT
	if (transfer->pending_.size() - transfer->pendingPos_ >= HIGH_WATER) {
		transfer->paused_ = true;
		return CURL_WRITEFUNC_PAUSE;
	}

	transfer->headersDone_ = true;
	transfer->pending_.append(static_cast<char*>(ptr), len);
	return len;
}

size_t HttpTransfer::header_cb(void* ptr, size_t size, size_t nmemb, void* data) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);

	const size_t len = size * nmemb;
	if (!ptr || len == 0)
		return len;

	std::string_view sv(static_cast<const char*>(ptr), len);

	if (!sv.empty() && sv.back() == '\n')
		sv.remove_suffix(1);
	if (!sv.empty() && sv.back() == '\r')
		sv.remove_suffix(1);

	if (sv.empty()) {
		// End of one header block. Interim (1xx) responses and redirects curl
		// is about to follow are not the response the caller gets.
		long status = 0;
		curl_easy_getinfo(transfer->curlEasy, CURLINFO_RESPONSE_CODE, &status);
		if (status / 100 == 1)
			return len;
		if (status / 100 == 3 && transfer->policy_.followRedirects &&
			util::headerValue(transfer->responseHeaders_, "Location"))
			return len;

		transfer->headersDone_ = true;
		return len;
	}
	// Each status line starts a new response, only the last one's headers are kept
	if (sv.rfind("HTTP/", 0) == 0) {
		transfer->responseHeaders_.clear();
		return len;
	}

	transfer->responseHeaders_.emplace_back(sv);
	return len;
}

int HttpTransfer::progress_cb(void* data, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
	HttpTransfer* transfer = static_cast<HttpTransfer*>(data);
	return transfer->ctx_.done() ? 1 : 0;
}

HttpResponse CurlTransport::operator()(const Context& ctx, HttpRequest& request) const {
	auto transfer = std::make_shared<HttpTransfer>(ctx, this->policy_);
	HttpResponse response = transfer->perform(request);
	if (!response.error)
		response.body = std::make_shared<TransferBodyReader>(std::move(transfer));
	return response;
}

// Client implementation
Client::Client(ClientConfig config) : config_(std::move(config)) {
	this->transport_ = CurlTransport(this->config_.policy);
}

Client::Client(ClientConfig config, Transport transport)
	: config_(std::move(config)), transport_(std::move(transport)) {
	if (!this->transport_)
		this->transport_ = CurlTransport(this->config_.policy);
}

Client& Client::use(MiddlewarePtr middleware) {
	if (middleware)
		this->middlewares_.push_back(std::move(middleware));
	return *this;
}

Client& Client::withHeader(const std::string& name, const std::string& value) {
	auto& headers = this->config_.headers;
	headers.erase(std::remove_if(headers.begin(), headers.end(), [&](const std::string& h) {
		std::string_view k, v;
		return util::splitHeader(h, k, v) && util::iequals(k, name);
	}), headers.end());
	headers.push_back(name + ": " + value);
	return *this;
}

#define HTTP_METHOD(name) \
	Request Client::name(const std::string& path) const { return Request(*this, #name, this->resolve(path)); }
HTTP_METHODS
#undef HTTP_METHOD

Request Client::request(const std::string& method, const std::string& path) const {
	return Request(*this, util::toupper(method), this->resolve(path));
}

std::string Client::resolve(const std::string& path) const {
	if (this->config_.baseUrl.empty() || path.find("://") != std::string::npos)
		return path;
	if (path.empty())
		return this->config_.baseUrl;

	std::string url = this->config_.baseUrl;
	bool baseSlash = url.back() == '/';
	bool pathSlash = path.front() == '/';
	if (baseSlash && pathSlash)
		url.pop_back();
	else if (!baseSlash && !pathSlash)
		url += '/';
	return url + path;
}

HttpResponse Client::execute(const Context& ctx, HttpRequest& request, const std::vector<MiddlewarePtr>& extra) const {
	Transport transport = this->transport_;
	Handler terminal = [transport](const Context& ctx, HttpRequest& request) -> HttpResponse {
		if (ctx.done()) [[unlikely]]
			return HttpResponse::failure(ctx.err());
		return transport(ctx, request);
	};

	std::vector<MiddlewarePtr> all;
	all.reserve(this->middlewares_.size() + extra.size());
	all.insert(all.end(), this->middlewares_.begin(), this->middlewares_.end());
	all.insert(all.end(), extra.begin(), extra.end());

	Handler handler = chain(std::move(terminal), all);
	return handler(ctx, request);
}

// Request implementation
Request::Request(const Client& client, std::string method, std::string url)
	: client_(&client), method_(std::move(method)), url_(std::move(url)) {}

Request& Request::withHeader(const std::string& name, const std::string& value) {
	this->headers_.erase(std::remove_if(this->headers_.begin(), this->headers_.end(), [&](const std::string& h) {
		std::string_view k, v;
		return util::splitHeader(h, k, v) && util::iequals(k, name);
	}), this->headers_.end());
	this->headers_.push_back(name + ": " + value);
	return *this;
}

Request& Request::withQuery(const std::string& key, const std::string& value) {
	this->query_.emplace_back(key, value);
	return *this;
}

Request& Request::withBody(std::string body) {
	this->body_ = std::move(body);
	return *this;
}

Request& Request::withJson(const nlohmann::json& body) {
	this->body_ = body.dump();
	bool hasContentType = std::any_of(this->headers_.begin(), this->headers_.end(), [](const std::string& h) {
		std::string_view k, v;
		return util::splitHeader(h, k, v) && util::iequals(k, "Content-Type");
	});
	if (!hasContentType)
		this->headers_.push_back("Content-Type: application/json");
	return *this;
}

Request& Request::withMiddleware(MiddlewarePtr middleware) {
	if (middleware)
		this->middlewares_.push_back(std::move(middleware));
	return *this;
}

Request& Request::withTimeout(std::chrono::milliseconds timeout) {
	this->timeout_ = timeout;
	return *this;
}

HttpRequest Request::build() const {
	HttpRequest request;
	request.methodName = this->method_;
	request.url = this->url_;

	if (!this->query_.empty()) {
		std::ostringstream query;
		char sep = request.url.find('?') == std::string::npos ? '?' : '&';
		for (const auto& [key, value] : this->query_) {
			query << sep << util::urlEscape(key) << '=' << util::urlEscape(value);
			sep = '&';
		}

		// The fragment stays last
		auto hash = request.url.find('#');
		if (hash == std::string::npos)
			request.url += query.str();
		else
			request.url.insert(hash, query.str());
	}

	// Request headers replace client headers of the same name
	for (const auto& h : this->client_->config().headers) {
		std::string_view name, value;
		if (util::splitHeader(h, name, value) && util::headerValue(this->headers_, name))
			continue;
		request.headers.push_back(h);
	}
	request.headers.insert(request.headers.end(), this->headers_.begin(), this->headers_.end());

	if (this->body_)
		request.setBody(*this->body_);

	return request;
}

HttpResponse Request::perform(const Context& ctx) const {
	HttpRequest request = this->build();

	if (this->timeout_) {
		Context scoped = ctx.withTimeout(*this->timeout_);
		return this->client_->execute(scoped, request, this->middlewares_);
	}
	return this->client_->execute(ctx, request, this->middlewares_);
}

HttpResponse Request::performOrThrow(const Context& ctx) const {
	HttpResponse response = this->perform(ctx);
	if (response.error)
		throw RequestError(response.error);
	return response;
}

void Request::stream(const Context& ctx, const ChunkHandler& handler, const StreamOptions& options) const {
	HttpResponse response = this->performOrThrow(ctx);
	streamChunks(response, handler, options);
}

void Request::streamLines(const Context& ctx, const LineHandler& handler, const StreamOptions& options) const {
	HttpResponse response = this->performOrThrow(ctx);
	http_resilience::streamLines(response, handler, options);
}

void Request::streamJson(const Context& ctx, const JsonHandler& handler, const StreamOptions& options) const {
	HttpResponse response = this->performOrThrow(ctx);
	http_resilience::streamJson(response, handler, options);
}

void Request::streamSSE(const Context& ctx, const SSEHandler& handler, const StreamOptions& options) const {
	HttpResponse response = this->performOrThrow(ctx);

	std::string contentType = response.header("Content-Type").value_or("");
	if (contentType.find("text/event-stream") == std::string::npos)
		throw StreamDecodeError("unexpected content type for SSE: " + contentType);

	http_resilience::streamSSE(response, handler, options);
}

} // namespace http_resilience
