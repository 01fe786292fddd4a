#include <gtest/gtest.h>

#include "envelope.hpp"
#include "json_codec.hpp"

#include <nlohmann/json.hpp>

#include <string>

using sysmon::ErrorCode;
using sysmon::RequestId;
using sysmon::codec::DecodeError;

namespace {

ErrorCode decode_error_code(const std::string& bytes) {
	try {
		sysmon::codec::decode_request(bytes);
	} catch (const DecodeError& exc) {
		return exc.code();
	}
	ADD_FAILURE() << "expected DecodeError for " << bytes;
	return ErrorCode::InternalError;
}

}

TEST(JsonCodec, DecodesStringIdAndParams) {
	auto req = sysmon::codec::decode_request(
	    R"({"jsonrpc":"2.0","id":"abc","method":"getProcessByPID","params":{"pid":1}})");
	EXPECT_EQ(req.jsonrpc, "2.0");
	EXPECT_EQ(std::get<std::string>(req.id), "abc");
	EXPECT_EQ(req.method, "getProcessByPID");
	EXPECT_EQ(req.params["pid"], 1);
}

TEST(JsonCodec, DecodesIntegerId) {
	auto req = sysmon::codec::decode_request(R"({"jsonrpc":"2.0","id":7,"method":"getCPUInfo"})");
	ASSERT_TRUE(std::holds_alternative<std::int64_t>(req.id));
	EXPECT_EQ(std::get<std::int64_t>(req.id), 7);
	EXPECT_TRUE(req.params.is_object());
	EXPECT_TRUE(req.params.empty());
}

TEST(JsonCodec, MissingOrNullIdIsNotification) {
	auto missing = sysmon::codec::decode_request(R"({"jsonrpc":"2.0","method":"initialized"})");
	EXPECT_TRUE(sysmon::is_notification(missing.id));

	auto null_id = sysmon::codec::decode_request(R"({"jsonrpc":"2.0","id":null,"method":"initialized"})");
	EXPECT_TRUE(sysmon::is_notification(null_id.id));
}

TEST(JsonCodec, MissingJsonrpcDefaultsToTwoPointZero) {
	auto req = sysmon::codec::decode_request(R"({"id":1,"method":"tools/list"})");
	EXPECT_EQ(req.jsonrpc, "2.0");
}

TEST(JsonCodec, NullParamsBecomeEmptyObject) {
	auto req = sysmon::codec::decode_request(R"({"id":1,"method":"tools/list","params":null})");
	EXPECT_TRUE(req.params.is_object());
}

TEST(JsonCodec, RejectsNonJsonAsParseError) {
	EXPECT_EQ(decode_error_code("{not json"), ErrorCode::ParseError);
	EXPECT_EQ(decode_error_code(""), ErrorCode::ParseError);
}

TEST(JsonCodec, RejectsMalformedShapesAsInvalidRequest) {
	EXPECT_EQ(decode_error_code("[]"), ErrorCode::InvalidRequest);
	EXPECT_EQ(decode_error_code("42"), ErrorCode::InvalidRequest);
	EXPECT_EQ(decode_error_code(R"({"id":1})"), ErrorCode::InvalidRequest);
	EXPECT_EQ(decode_error_code(R"({"id":1,"method":5})"), ErrorCode::InvalidRequest);
	EXPECT_EQ(decode_error_code(R"({"id":1.5,"method":"x"})"), ErrorCode::InvalidRequest);
	EXPECT_EQ(decode_error_code(R"({"id":true,"method":"x"})"), ErrorCode::InvalidRequest);
	EXPECT_EQ(decode_error_code(R"({"id":[1],"method":"x"})"), ErrorCode::InvalidRequest);
}

TEST(JsonCodec, InvalidRequestKeepsRecoverableId) {
	try {
		sysmon::codec::decode_request(R"({"id":"keep-me"})");
		FAIL() << "expected DecodeError";
	} catch (const DecodeError& exc) {
		EXPECT_EQ(exc.code(), ErrorCode::InvalidRequest);
		EXPECT_EQ(std::get<std::string>(exc.id()), "keep-me");
	}
}

TEST(JsonCodec, EncodesSuccessWithoutErrorField) {
	auto resp = sysmon::make_success(RequestId{std::int64_t{3}}, {{"cores", 8}});
	auto out = nlohmann::json::parse(sysmon::codec::encode_response(resp));

	EXPECT_EQ(out["jsonrpc"], "2.0");
	EXPECT_EQ(out["id"], 3);
	EXPECT_EQ(out["result"]["cores"], 8);
	EXPECT_FALSE(out.contains("error"));
}

TEST(JsonCodec, EncodesErrorWithoutResultField) {
	auto resp = sysmon::make_failure(RequestId{std::string("r1")}, ErrorCode::MethodNotFound, "Method not found");
	auto out = nlohmann::json::parse(sysmon::codec::encode_response(resp));

	EXPECT_EQ(out["id"], "r1");
	EXPECT_EQ(out["error"]["code"], -32601);
	EXPECT_EQ(out["error"]["message"], "Method not found");
	EXPECT_FALSE(out["error"].contains("data"));
	EXPECT_FALSE(out.contains("result"));
}

TEST(JsonCodec, EncodesErrorDataWhenPresent) {
	auto resp = sysmon::make_failure(RequestId{}, ErrorCode::InternalError, "boom", nlohmann::json{{"detail", "x"}});
	auto out = sysmon::codec::response_to_json(resp);

	EXPECT_TRUE(out["id"].is_null());
	EXPECT_EQ(out["error"]["data"]["detail"], "x");
}

TEST(JsonCodec, InvalidUtf8IsReplacedOnEncode) {
	auto resp = sysmon::make_success(RequestId{std::int64_t{1}}, {{"name", std::string("bad\xff")}});
	std::string encoded;
	ASSERT_NO_THROW(encoded = sysmon::codec::encode_response(resp));
	EXPECT_NO_THROW(nlohmann::json::parse(encoded));
}
