#include "Stream.hpp"

#include <charconv>
#include <vector>

namespace http_resilience {

namespace {

void checkResponse(const HttpResponse& response, const StreamOptions& options) {
	if (!response.body)
		throw StreamDecodeError("response body is missing");

	if (!options.contentType.empty()) {
		std::string contentType = response.header("Content-Type").value_or("");
		if (contentType.find(options.contentType) == std::string::npos)
			throw StreamDecodeError("unexpected content type: " + contentType);
	}
}

/**
 * Splits a body into delimiter-separated tokens, reading bufferSize bytes at a time.
 * With anyLineEnding the delimiter is ignored and CRLF, LF and a lone CR all end a line.
 */
class LineScanner {
public:
	LineScanner(BodyReader& reader, const StreamOptions& options, bool anyLineEnding = false)
		: reader_(reader),
		  delimiter_(options.delimiter.empty() ? "\n" : options.delimiter),
		  anyLineEnding_(anyLineEnding),
		  stripCR_(!anyLineEnding && this->delimiter_ == "\n"),
		  chunk_(options.bufferSize ? options.bufferSize : 4096),
		  maxTokenSize_(options.maxTokenSize) {}

	bool next(std::string& line) {
		while (1) {
			size_t width = 0;
			size_t found = this->find(width);
			if (found != std::string::npos) {
				this->emit(line, found);
				this->pos_ = found + width;
				this->scanned_ = this->pos_;
				return true;
			}

			if (this->maxTokenSize_ && this->buffer_.size() - this->pos_ > this->maxTokenSize_)
				throw StreamDecodeError("token too long: exceeds " + std::to_string(this->maxTokenSize_) + " bytes");

			if (this->eof_) {
				if (this->pos_ >= this->buffer_.size())
					return false;
				this->emit(line, this->buffer_.size());
				this->pos_ = this->scanned_ = this->buffer_.size();
				return true;
			}

			// Keep the unconsumed tail only, the delimiter may straddle two reads
			this->buffer_.erase(0, this->pos_);
			this->pos_ = 0;
			size_t overlap = this->anyLineEnding_ ? 1 : this->delimiter_.size() - 1;
			this->scanned_ = this->buffer_.size() > overlap ? this->buffer_.size() - overlap : 0;

			size_t n = this->reader_.read(this->chunk_.data(), this->chunk_.size());
			if (n == 0)
				this->eof_ = true;
			else
				this->buffer_.append(this->chunk_.data(), n);
		}
	}

private:
	// Position of the next terminator from scanned_, its length in width
	size_t find(size_t& width) const {
		if (!this->anyLineEnding_) {
			width = this->delimiter_.size();
			return this->buffer_.find(this->delimiter_, this->scanned_);
		}

		width = 1;
		size_t found = this->buffer_.find_first_of("\r\n", this->scanned_);
		if (found == std::string::npos || this->buffer_[found] == '\n')
			return found;
		if (found + 1 < this->buffer_.size()) {
			if (this->buffer_[found + 1] == '\n')
				width = 2;
			return found;
		}
		// A CR closing the buffer may be the first half of a CRLF
		return this->eof_ ? found : std::string::npos;
	}

	void emit(std::string& line, size_t end) {
		if (this->maxTokenSize_ && end - this->pos_ > this->maxTokenSize_)
			throw StreamDecodeError("token too long: exceeds " + std::to_string(this->maxTokenSize_) + " bytes");

		line.assign(this->buffer_, this->pos_, end - this->pos_);
		if (this->stripCR_ && !line.empty() && line.back() == '\r')
			line.pop_back();
	}

	BodyReader& reader_;
	const std::string delimiter_;
	const bool anyLineEnding_;
	const bool stripCR_;
	std::vector<char> chunk_;
	const size_t maxTokenSize_;

	std::string buffer_;
	size_t pos_ = 0;
	size_t scanned_ = 0;
	bool eof_ = false;
};

} // namespace

void streamChunks(HttpResponse& response, const ChunkHandler& handler, const StreamOptions& options) {
	checkResponse(response, options);

	std::vector<char> buffer(options.bufferSize ? options.bufferSize : 4096);
	size_t n;
	while ((n = response.body->read(buffer.data(), buffer.size())) > 0)
		handler(std::string_view(buffer.data(), n));

	response.body.reset();
}

void streamLines(HttpResponse& response, const LineHandler& handler, const StreamOptions& options) {
	checkResponse(response, options);

	LineScanner scanner(*response.body, options);
	std::string line;
	while (scanner.next(line))
		handler(line);

	response.body.reset();
}

void streamJson(HttpResponse& response, const JsonHandler& handler, const StreamOptions& options) {
	streamLines(response, [&handler](std::string_view line) {
		if (line.empty())
			return;

		nlohmann::json value;
		try {
			value = nlohmann::json::parse(line);
		} catch (const nlohmann::json::parse_error& e) {
			throw StreamDecodeError(std::string("invalid JSON line: ") + e.what());
		}
		handler(value);
	}, options);
}

SSEParser::SSEParser(EventHandler handler) : handler_(std::move(handler)) {}

void SSEParser::feedLine(std::string_view line) {
	if (line.empty()) {
		this->dispatch();
		return;
	}

	// Comment
	if (line.front() == ':')
		return;

	std::string_view field = line;
	std::string_view value;
	size_t colon = line.find(':');
	if (colon != std::string_view::npos) {
		field = line.substr(0, colon);
		value = line.substr(colon + 1);
		if (!value.empty() && value.front() == ' ')
			value.remove_prefix(1);
	}

	if (field == "event") {
		this->event_.assign(value);
	} else if (field == "data") {
		if (this->hasData_)
			this->data_ += '\n';
		this->data_.append(value);
		this->hasData_ = true;
	} else if (field == "id") {
		this->id_.assign(value);
	} else if (field == "retry") {
		int retry = 0;
		auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), retry);
		if (ec == std::errc() && ptr == value.data() + value.size() && !value.empty() && retry >= 0)
			this->retry_ = retry;
	}
	// Unknown fields are ignored
}

void SSEParser::finish() {
	this->dispatch();
}

void SSEParser::dispatch() {
	if (this->hasData_) {
		SSEEvent event;
		event.id = std::move(this->id_);
		if (!this->event_.empty())
			event.event = std::move(this->event_);
		event.data = std::move(this->data_);
		event.retry = this->retry_;

		this->reset();
		if (this->handler_)
			this->handler_(event);
		return;
	}
	this->reset();
}

void SSEParser::reset() {
	this->id_.clear();
	this->event_.clear();
	this->data_.clear();
	this->retry_ = 0;
	this->hasData_ = false;
}

void streamSSE(HttpResponse& response, const SSEHandler& handler, const StreamOptions& options) {
	StreamOptions lineOptions = options;
	lineOptions.delimiter = "\n";
	checkResponse(response, lineOptions);

	if (handler.onOpen)
		handler.onOpen();

	try {
		SSEParser parser(handler.onEvent);
		LineScanner scanner(*response.body, lineOptions, true);
		std::string line;
		while (scanner.next(line))
			parser.feedLine(line);
		parser.finish();
	} catch (...) {
		response.body.reset();
		if (handler.onClose)
			handler.onClose();
		throw;
	}

	response.body.reset();
	if (handler.onClose)
		handler.onClose();
}

void streamSSE(HttpResponse& response, const SSEParser::EventHandler& onEvent, const StreamOptions& options) {
	SSEHandler handler;
	handler.onEvent = onEvent;
	streamSSE(response, handler, options);
}

} // namespace http_resilience
