#include <gtest/gtest.h>

#include "framing.hpp"
#include "stdio_server.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <vector>

using sysmon::framing::ReadStatus;

namespace {

std::vector<nlohmann::json> read_replies(const std::string& output) {
	std::istringstream in(output);
	std::vector<nlohmann::json> replies;
	std::string body;
	while (sysmon::framing::read_frame(in, body) == ReadStatus::Message) {
		replies.push_back(nlohmann::json::parse(body));
	}
	return replies;
}

}

TEST(Framing, ReadsSingleFrame) {
	std::istringstream in(frame(R"({"a":1})"));
	std::string body;
	ASSERT_EQ(sysmon::framing::read_frame(in, body), ReadStatus::Message);
	EXPECT_EQ(body, R"({"a":1})");
	EXPECT_EQ(sysmon::framing::read_frame(in, body), ReadStatus::EndOfStream);
}

TEST(Framing, HeaderNameIsCaseInsensitiveAndExtraHeadersIgnored) {
	std::istringstream in("content-length: 2\r\nContent-Type: application/json\r\n\r\n{}");
	std::string body;
	ASSERT_EQ(sysmon::framing::read_frame(in, body), ReadStatus::Message);
	EXPECT_EQ(body, "{}");
}

TEST(Framing, AcceptsBareNewlines) {
	std::istringstream in("Content-Length: 2\n\n{}");
	std::string body;
	ASSERT_EQ(sysmon::framing::read_frame(in, body), ReadStatus::Message);
	EXPECT_EQ(body, "{}");
}

TEST(Framing, SkipsBlockWithoutContentLength) {
	std::istringstream in("X-Other: 1\r\n\r\n" + frame("[]"));
	std::string body;
	ASSERT_EQ(sysmon::framing::read_frame(in, body), ReadStatus::Message);
	EXPECT_EQ(body, "[]");
}

TEST(Framing, ReportsTruncatedBody) {
	std::istringstream in("Content-Length: 100\r\n\r\n{\"jsonrpc\":");
	std::string body;
	EXPECT_EQ(sysmon::framing::read_frame(in, body), ReadStatus::Truncated);
}

TEST(Framing, OversizedLengthFailsFrame) {
	std::string announced = std::to_string(sysmon::framing::kMaxBodySize + 1);
	std::istringstream in("Content-Length: " + announced + "\r\n\r\n" + frame("{}"));
	std::string body;
	EXPECT_EQ(sysmon::framing::read_frame(in, body), ReadStatus::Oversized);

	std::istringstream overflow("Content-Length: 99999999999999999999999999\r\n\r\n{}");
	EXPECT_EQ(sysmon::framing::read_frame(overflow, body), ReadStatus::Oversized);
}

TEST(Framing, LengthAtLimitIsNotOversized) {
	std::istringstream in("Content-Length: " + std::to_string(sysmon::framing::kMaxBodySize) + "\r\n\r\n{}");
	std::string body;
	EXPECT_EQ(sysmon::framing::read_frame(in, body), ReadStatus::Truncated);
}

TEST(Framing, BodyMayContainNewlines) {
	std::string payload = "{\n\"a\": 1\n}";
	std::istringstream in(frame(payload) + frame("{}"));
	std::string body;
	ASSERT_EQ(sysmon::framing::read_frame(in, body), ReadStatus::Message);
	EXPECT_EQ(body, payload);
	ASSERT_EQ(sysmon::framing::read_frame(in, body), ReadStatus::Message);
	EXPECT_EQ(body, "{}");
}

TEST(Framing, WritesHeaderAndBody) {
	std::ostringstream out;
	ASSERT_TRUE(sysmon::framing::write_frame(out, "{}"));
	EXPECT_EQ(out.str(), "Content-Length: 2\r\n\r\n{}");
}

TEST(StdioServer, AnswersRequestsInOrder) {
	FakeContext fake;
	std::istringstream in(frame(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2099-01-01"}})") +
	                      frame(R"({"jsonrpc":"2.0","id":"two","method":"tools/list"})"));
	std::ostringstream out;

	sysmon::StdioServer server(*fake.context, in, out);
	EXPECT_TRUE(server.run());
	EXPECT_EQ(server.messages_handled(), 2u);

	auto replies = read_replies(out.str());
	ASSERT_EQ(replies.size(), 2u);
	EXPECT_EQ(replies[0]["id"], 1);
	EXPECT_EQ(replies[0]["result"]["protocolVersion"], "2099-01-01");
	EXPECT_EQ(replies[1]["id"], "two");
	EXPECT_EQ(replies[1]["result"]["tools"].size(), 11u);
}

TEST(StdioServer, NotificationsProduceNoOutput) {
	FakeContext fake;
	std::istringstream in(frame(R"({"jsonrpc":"2.0","method":"initialized"})") +
	                      frame(R"({"jsonrpc":"2.0","method":"startMonitoring"})"));
	std::ostringstream out;

	sysmon::StdioServer server(*fake.context, in, out);
	EXPECT_TRUE(server.run());
	EXPECT_TRUE(out.str().empty());
	EXPECT_TRUE(fake.context->monitor.is_monitoring_active());
}

TEST(StdioServer, ParseErrorGetsFramedReply) {
	FakeContext fake;
	std::istringstream in(frame("{oops") + frame(R"({"jsonrpc":"2.0","id":5,"method":"getCPUInfo"})"));
	std::ostringstream out;

	sysmon::StdioServer server(*fake.context, in, out);
	EXPECT_TRUE(server.run());

	auto replies = read_replies(out.str());
	ASSERT_EQ(replies.size(), 2u);
	EXPECT_TRUE(replies[0]["id"].is_null());
	EXPECT_EQ(replies[0]["error"]["code"], -32700);
	EXPECT_EQ(replies[0]["error"]["message"], "Parse error");
	EXPECT_EQ(replies[1]["id"], 5);
	EXPECT_EQ(replies[1]["result"]["cores"], 4);
}

TEST(StdioServer, UnknownMethodDoesNotStopLoop) {
	FakeContext fake;
	std::istringstream in(frame(R"({"jsonrpc":"2.0","id":1,"method":"doesNotExist"})") +
	                      frame(R"({"jsonrpc":"2.0","id":2,"method":"getSystemInfo"})"));
	std::ostringstream out;

	sysmon::StdioServer server(*fake.context, in, out);
	EXPECT_TRUE(server.run());

	auto replies = read_replies(out.str());
	ASSERT_EQ(replies.size(), 2u);
	EXPECT_EQ(replies[0]["error"]["code"], -32601);
	EXPECT_EQ(replies[1]["result"]["hostname"], "testhost");
}

TEST(StdioServer, TruncatedFrameFailsWithoutReply) {
	FakeContext fake;
	std::istringstream in(frame(R"({"jsonrpc":"2.0","id":1,"method":"getCPUInfo"})") +
	                      "Content-Length: 500\r\n\r\n{\"jsonrpc\":\"2.0\",\"id\":2");
	std::ostringstream out;

	sysmon::StdioServer server(*fake.context, in, out);
	EXPECT_FALSE(server.run());

	auto replies = read_replies(out.str());
	ASSERT_EQ(replies.size(), 1u);
	EXPECT_EQ(replies[0]["id"], 1);
}

TEST(StdioServer, EmptyInputEndsCleanly) {
	FakeContext fake;
	std::istringstream in("");
	std::ostringstream out;

	sysmon::StdioServer server(*fake.context, in, out);
	EXPECT_TRUE(server.run());
	EXPECT_EQ(server.messages_handled(), 0u);
}

TEST(StdioServer, InvalidRequestShapeGetsFramedError) {
	FakeContext fake;
	std::istringstream in(frame(R"({"jsonrpc":"2.0","id":"x","method":12})"));
	std::ostringstream out;

	sysmon::StdioServer server(*fake.context, in, out);
	EXPECT_TRUE(server.run());

	auto replies = read_replies(out.str());
	ASSERT_EQ(replies.size(), 1u);
	EXPECT_EQ(replies[0]["id"], "x");
	EXPECT_EQ(replies[0]["error"]["code"], -32600);
}

TEST(StdioServer, OversizedFrameEndsLoopWithoutReadingBody) {
	FakeContext fake;
	std::string announced = std::to_string(sysmon::framing::kMaxBodySize + 1);
	std::istringstream in(frame(R"({"jsonrpc":"2.0","id":1,"method":"getCPUInfo"})") +
	                      "Content-Length: " + announced + "\r\n\r\n" +
	                      frame(R"({"jsonrpc":"2.0","id":2,"method":"getCPUInfo"})"));
	std::ostringstream out;

	sysmon::StdioServer server(*fake.context, in, out);
	EXPECT_FALSE(server.run());

	auto replies = read_replies(out.str());
	ASSERT_EQ(replies.size(), 1u);
	EXPECT_EQ(replies[0]["id"], 1);
}
