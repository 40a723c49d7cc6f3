#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace http_resilience {

// Malformed stream content, missing body or unexpected content type
class StreamDecodeError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

struct StreamOptions {
	size_t bufferSize = 4096;		  // bytes per read
	std::string contentType;		  // required substring of Content-Type, empty = any
	std::string delimiter = "\n";	  // line delimiter, "\n" also strips a trailing "\r"
	size_t maxTokenSize = 1024 * 1024; // longest accepted line
};

inline StreamOptions ByteDelimiter(char delimiter, StreamOptions options = StreamOptions()) {
	options.delimiter = std::string(1, delimiter);
	return options;
}

using ChunkHandler = std::function<void(std::string_view chunk)>;
using LineHandler = std::function<void(std::string_view line)>;
using JsonHandler = std::function<void(const nlohmann::json& value)>;

/**
 * Decoders drain response.body and release it when done.
 * A missing body or a content type mismatch throws StreamDecodeError before any read.
 * Exceptions thrown by the handler stop the stream and propagate unchanged.
 */
void streamChunks(HttpResponse& response, const ChunkHandler& handler, const StreamOptions& options = StreamOptions());

// Each line without its delimiter, the unterminated tail included
void streamLines(HttpResponse& response, const LineHandler& handler, const StreamOptions& options = StreamOptions());

// NDJSON: one JSON value per non-empty line
void streamJson(HttpResponse& response, const JsonHandler& handler, const StreamOptions& options = StreamOptions());

/**
 * NDJSON decoded into T through nlohmann's from_json / get<T>().
 *
 *   streamInto<User>(response, [](User user) { ... });
 */
template <typename T, typename Fn>
void streamInto(HttpResponse& response, Fn&& handler, const StreamOptions& options = StreamOptions()) {
	streamJson(response, [&handler](const nlohmann::json& value) {
		auto decode = [&value]() -> T {
			try {
				return value.get<T>();
			} catch (const nlohmann::json::exception& e) {
				throw StreamDecodeError(std::string("cannot decode stream value: ") + e.what());
			}
		};
		handler(decode());
	}, options);
}

struct SSEEvent {
	std::string id;
	std::string event = "message";
	std::string data;
	int retry = 0; // 0 when absent or invalid
};

// onOpen runs before the first read, onClose after the stream ends or fails
struct SSEHandler {
	std::function<void(const SSEEvent&)> onEvent;
	std::function<void()> onOpen;
	std::function<void()> onClose;
};

/**
 * Line-oriented Server-Sent Events state machine.
 * Fields accumulate until a blank line dispatches them; every event starts blank.
 */
class SSEParser {
public:
	using EventHandler = std::function<void(const SSEEvent&)>;

	explicit SSEParser(EventHandler handler);

	// One line without its terminator
	void feedLine(std::string_view line);

	// Dispatches a pending event that has data
	void finish();

private:
	void dispatch();
	void reset();

	EventHandler handler_;

	std::string id_;
	std::string event_;
	std::string data_;
	int retry_ = 0;
	bool hasData_ = false;
};

void streamSSE(HttpResponse& response, const SSEHandler& handler, const StreamOptions& options = StreamOptions());
void streamSSE(HttpResponse& response, const SSEParser::EventHandler& onEvent, const StreamOptions& options = StreamOptions());

} // namespace http_resilience
