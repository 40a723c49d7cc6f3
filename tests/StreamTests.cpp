#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "MockTransport.hpp"
#include "Stream.hpp"

using namespace http_resilience;
using namespace http_resilience::testing;

namespace {

// Hands out at most chunk bytes per read
class TrickleReader : public BodyReader {
public:
	TrickleReader(std::string data, size_t chunk) : data_(std::move(data)), chunk_(chunk) {}

	size_t read(char* buf, size_t len) override {
		size_t n = std::min({len, this->chunk_, this->data_.size() - this->pos_});
		std::copy_n(this->data_.data() + this->pos_, n, buf);
		this->pos_ += n;
		return n;
	}

private:
	std::string data_;
	size_t chunk_;
	size_t pos_ = 0;
};

HttpResponse trickle(const std::string& body, size_t chunk, std::vector<std::string> headers = {}) {
	HttpResponse r = makeResponse(200, "", std::move(headers));
	r.body = std::make_shared<TrickleReader>(body, chunk);
	return r;
}

struct User {
	std::string name;
	int age = 0;
};

void from_json(const nlohmann::json& j, User& u) {
	j.at("name").get_to(u.name);
	j.at("age").get_to(u.age);
}

} // namespace

TEST(StreamTests, ChunksCoverWholeBody) {
	std::string body(10000, 'a');
	auto response = makeResponse(200, body);

	StreamOptions options;
	options.bufferSize = 4096;
	std::string seen;
	int chunks = 0;
	streamChunks(response, [&](std::string_view chunk) {
		EXPECT_FALSE(chunk.empty());
		EXPECT_LE(chunk.size(), 4096u);
		seen.append(chunk);
		++chunks;
	}, options);

	EXPECT_EQ(seen, body);
	EXPECT_EQ(chunks, 3);
	EXPECT_FALSE(response.body);
}

TEST(StreamTests, HandlerErrorStopsChunks) {
	auto response = makeResponse(200, std::string(10000, 'a'));
	StreamOptions options;
	options.bufferSize = 1000;

	int chunks = 0;
	EXPECT_THROW(streamChunks(response, [&](std::string_view) {
		if (++chunks == 2) throw std::runtime_error("stop");
	}, options), std::runtime_error);
	EXPECT_EQ(chunks, 2);
}

TEST(StreamTests, MissingBody) {
	HttpResponse response;
	response.status = 204;
	EXPECT_THROW(streamChunks(response, [](std::string_view) {}), StreamDecodeError);
}

TEST(StreamTests, ContentTypeMismatch) {
	auto response = makeResponse(200, "x", {"Content-Type: text/html"});
	StreamOptions options;
	options.contentType = "application/x-ndjson";

	int calls = 0;
	EXPECT_THROW(streamLines(response, [&](std::string_view) { ++calls; }, options), StreamDecodeError);
	EXPECT_EQ(calls, 0);
}

TEST(StreamTests, LinesSplitAcrossReads) {
	auto response = trickle("first\r\nsecond\n\nthird", 3);

	std::vector<std::string> lines;
	streamLines(response, [&](std::string_view line) { lines.emplace_back(line); });

	std::vector<std::string> expected = {"first", "second", "", "third"};
	EXPECT_EQ(lines, expected);
}

TEST(StreamTests, TrailingDelimiterAddsNoEmptyLine) {
	auto response = makeResponse(200, "a\nb\n");
	std::vector<std::string> lines;
	streamLines(response, [&](std::string_view line) { lines.emplace_back(line); });

	std::vector<std::string> expected = {"a", "b"};
	EXPECT_EQ(lines, expected);
}

TEST(StreamTests, CustomStringDelimiterStraddlingReads) {
	auto response = trickle("alpha<|>beta<|>gamma", 2);
	StreamOptions options;
	options.delimiter = "<|>";

	std::vector<std::string> parts;
	streamLines(response, [&](std::string_view part) { parts.emplace_back(part); }, options);

	std::vector<std::string> expected = {"alpha", "beta", "gamma"};
	EXPECT_EQ(parts, expected);
}

TEST(StreamTests, ByteDelimiterKeepsCarriageReturn) {
	auto response = makeResponse(200, std::string("a\r\0b\0", 5));

	std::vector<std::string> parts;
	streamLines(response, [&](std::string_view part) { parts.emplace_back(part); }, ByteDelimiter('\0'));

	std::vector<std::string> expected = {"a\r", "b"};
	EXPECT_EQ(parts, expected);
}

TEST(StreamTests, TokenTooLong) {
	auto response = makeResponse(200, std::string(100, 'x') + "\nshort\n");
	StreamOptions options;
	options.bufferSize = 16;
	options.maxTokenSize = 32;

	EXPECT_THROW(streamLines(response, [](std::string_view) {}, options), StreamDecodeError);
}

TEST(StreamTests, NdjsonSkipsBlankLines) {
	auto response = trickle("{\"a\":1}\n\n[1,2]\n\"s\"\n", 4);

	std::vector<nlohmann::json> values;
	streamJson(response, [&](const nlohmann::json& v) { values.push_back(v); });

	ASSERT_EQ(values.size(), 3u);
	EXPECT_EQ(values[0]["a"], 1);
	EXPECT_TRUE(values[1].is_array());
	EXPECT_EQ(values[2], "s");
}

TEST(StreamTests, MalformedJsonAborts) {
	auto response = makeResponse(200, "{\"ok\":true}\n{broken\n{\"never\":1}\n");

	int calls = 0;
	EXPECT_THROW(streamJson(response, [&](const nlohmann::json&) { ++calls; }), StreamDecodeError);
	EXPECT_EQ(calls, 1);
}

TEST(StreamTests, TypedDecode) {
	auto response = makeResponse(200, "{\"name\":\"ada\",\"age\":36}\n{\"name\":\"alan\",\"age\":41}\n");

	std::vector<User> users;
	streamInto<User>(response, [&](User user) { users.push_back(std::move(user)); });

	ASSERT_EQ(users.size(), 2u);
	EXPECT_EQ(users[0].name, "ada");
	EXPECT_EQ(users[1].age, 41);
}

TEST(StreamTests, TypedDecodeMismatchAborts) {
	auto response = makeResponse(200, "{\"name\":\"ada\",\"age\":\"old\"}\n");
	EXPECT_THROW(streamInto<User>(response, [](const User&) {}), StreamDecodeError);
}
