#pragma once

#include "utils.hpp"

#include <chrono>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#ifdef __cplusplus
extern "C" {
#endif
#include <curl/curl.h>
#ifdef __cplusplus
}
#endif

namespace http_resilience {

struct RequestPolicy {
	float timeout = 0;		// optional per-request timeout in seconds (<=0 means wait indefinitely)
	float connTimeout = 0;	// optional connection (DNS + handshake) timeout in seconds (<0 means default 300 second)

	uint32_t lowSpeedLimit = 0;	// in bytes
	uint32_t lowSpeedTime = 0;	// in seconds

	bool followRedirects = true;
};

// Fuck you, <winnt.h>
#ifdef _WIN32
#ifdef DELETE
#undef DELETE
#endif
#endif

/**
 * Pull-based body stream.
 * read() returns 0 at end of stream and throws on I/O failure.
 */
class BodyReader {
public:
	virtual ~BodyReader() = default;
	virtual size_t read(char* buf, size_t len) = 0;
};

class StringBodyReader : public BodyReader {
public:
	explicit StringBodyReader(std::string data) : data_(std::move(data)) {}

	size_t read(char* buf, size_t len) override {
		size_t n = std::min(len, this->data_.size() - this->pos_);
		if (n) std::memcpy(buf, this->data_.data() + this->pos_, n);
		this->pos_ += n;
		return n;
	}

	size_t size() const { return this->data_.size(); }

private:
	std::string data_;
	size_t pos_ = 0;
};

using BodyFactory = std::function<std::shared_ptr<BodyReader>()>;

inline std::string readAll(BodyReader& reader) {
	std::string out;
	char buf[8192];
	size_t n;
	while ((n = reader.read(buf, sizeof(buf))) > 0)
		out.append(buf, n);
	return out;
}

struct HttpRequest {
public:
#define HTTP_METHODS                                                                                                   \
	HTTP_METHOD(GET)                                                                                                   \
	HTTP_METHOD(POST)                                                                                                  \
	HTTP_METHOD(HEAD)                                                                                                  \
	HTTP_METHOD(PATCH)                                                                                                 \
	HTTP_METHOD(PUT)                                                                                                   \
	HTTP_METHOD(DELETE)                                                                                                \
	HTTP_METHOD(OPTIONS)

	enum Method : uint8_t {
#define HTTP_METHOD(methodName) methodName,
		HTTP_METHODS
#undef HTTP_METHOD
			OTHER = 255
	};
	static constexpr std::string_view MethodStr[] = {
#define HTTP_METHOD(methodName) #methodName,
		HTTP_METHODS
#undef HTTP_METHOD
	};
	static Method method2Enum(const std::string& methodName) {
#define HTTP_METHOD(name)                                                                                              \
	if (util::toupper(methodName) == #name) {                                                                          \
		return Method::name;                                                                                           \
	}
		HTTP_METHODS
#undef HTTP_METHOD

		return Method::OTHER;
	};

	std::string url;
	std::string methodName = "GET";
	std::vector<std::string> headers; // e.g. "Content-Type: application/json"

	// Body stream, consumed by the transport. getBody re-creates it for a retry.
	std::shared_ptr<BodyReader> body;
	BodyFactory getBody;

	// Installs an in-memory body together with a factory that can replay it
	void setBody(std::string data) {
		auto shared = std::make_shared<const std::string>(std::move(data));
		this->body = std::make_shared<StringBodyReader>(*shared);
		this->getBody = [shared]() -> std::shared_ptr<BodyReader> {
			return std::make_shared<StringBodyReader>(*shared);
		};
	}

	Method method() const { return method2Enum(this->methodName); }

	std::optional<std::string> header(std::string_view name) const {
		return util::headerValue(this->headers, name);
	}
};

struct HttpError {
	enum Kind : uint8_t {
		None,
		Transport,		  // transport failed, see curlCode
		Canceled,		  // caller's context was cancelled
		DeadlineExceeded, // caller's context deadline passed
		CircuitOpen,	  // rejected by the circuit breaker, transport never called
		BodyUnavailable	  // body could not be re-created
	};

	Kind kind = None;
	CURLcode curlCode = CURLE_OK;
	std::string message;

	explicit operator bool() const { return this->kind != None; }

	static HttpError make(Kind kind, std::string message) {
		HttpError e;
		e.kind = kind;
		e.message = std::move(message);
		return e;
	}
};

// Thrown by the stream helpers of Request when the call itself failed, and by
// a streaming body when the transfer breaks off
class RequestError : public std::runtime_error {
public:
	explicit RequestError(HttpError error) : std::runtime_error(error.message), error_(std::move(error)) {}

	const HttpError& error() const { return this->error_; }

private:
	HttpError error_;
};

struct TransferInfo {
	// In second
	float startAt = std::chrono::duration<float>(
		std::chrono::system_clock::now().time_since_epoch()).count();
	float connect = 0, appConnect = 0, startTransfer = 0, total = 0;
	float completeAt = 0;
};

struct HttpResponse {
	long status = 0;

	std::vector<std::string> headers;
	std::shared_ptr<BodyReader> body;
	HttpError error; // set on failure, status is 0 then

	TransferInfo transferInfo;

	static HttpResponse failure(HttpError error) {
		HttpResponse r;
		r.error = std::move(error);
		return r;
	}

	std::optional<std::string> header(std::string_view name) const {
		return util::headerValue(this->headers, name);
	}

	// Drains the body; empty when there is none
	std::string text() {
		if (!this->body) return {};
		std::string out = readAll(*this->body);
		this->body.reset();
		return out;
	}
};

} // namespace http_resilience
