#include <gtest/gtest.h>

#include "envelope.hpp"
#include "method/method.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <string>

using sysmon::ErrorCode;
using sysmon::RequestId;
using sysmon::Response;

namespace {

Response call(FakeContext& fake, const std::string& method, nlohmann::json params = nlohmann::json::object()) {
	return sysmon::methods::dispatch(make_request(method, RequestId{std::string("t-1")}, std::move(params)),
	                                 *fake.context);
}

}

TEST(Methods, UnknownMethodIsMethodNotFound) {
	FakeContext fake;
	auto resp = call(fake, "doesNotExist");
	ASSERT_TRUE(resp.error.has_value());
	EXPECT_EQ(resp.error->code, -32601);
	EXPECT_EQ(resp.error->message, "Method not found");
	EXPECT_EQ(std::get<std::string>(resp.id), "t-1");
}

TEST(Methods, RouterKeepsServingAfterUnknownMethod) {
	FakeContext fake;
	EXPECT_TRUE(sysmon::is_error(call(fake, "doesNotExist"), ErrorCode::MethodNotFound));

	auto resp = call(fake, "getSystemInfo");
	ASSERT_TRUE(resp.result.has_value());
	EXPECT_EQ((*resp.result)["hostname"], "testhost");
}

TEST(Methods, EchoesIntegerId) {
	FakeContext fake;
	auto resp = sysmon::methods::dispatch(make_request("getCPUInfo", RequestId{std::int64_t{77}}), *fake.context);
	EXPECT_EQ(std::get<std::int64_t>(resp.id), 77);
}

TEST(Methods, ResultAndErrorAreExclusive) {
	FakeContext fake;
	for (const char* method : {"getSystemInfo", "getProcessByPID", "nope", "tools/call"}) {
		auto resp = call(fake, method);
		EXPECT_NE(resp.result.has_value(), resp.error.has_value()) << method;
	}
}

TEST(Methods, DomainMethodsReturnSnapshots) {
	FakeContext fake;

	auto cpu = call(fake, "getCPUInfo");
	ASSERT_TRUE(cpu.result.has_value());
	EXPECT_EQ((*cpu.result)["cores"], 4);
	EXPECT_TRUE((*cpu.result)["temperature"].is_null());

	auto memory = call(fake, "getMemoryInfo");
	ASSERT_TRUE(memory.result.has_value());
	EXPECT_EQ((*memory.result)["total"], 8ULL << 30);

	auto disks = call(fake, "getDiskInfo");
	ASSERT_TRUE(disks.result.has_value());
	ASSERT_TRUE(disks.result->is_array());
	EXPECT_EQ((*disks.result)[0]["mount_point"], "/");

	auto networks = call(fake, "getNetworkInfo");
	ASSERT_TRUE(networks.result.has_value());
	EXPECT_EQ((*networks.result)[0]["interface"], "eth0");

	auto processes = call(fake, "getProcesses");
	ASSERT_TRUE(processes.result.has_value());
	EXPECT_EQ(processes.result->size(), 2u);
}

TEST(Methods, SystemMetricsBundlesEverything) {
	FakeContext fake;
	auto resp = call(fake, "getSystemMetrics");
	ASSERT_TRUE(resp.result.has_value());
	const auto& metrics = *resp.result;
	EXPECT_TRUE(metrics.contains("timestamp"));
	EXPECT_EQ(metrics["system_info"]["hostname"], "testhost");
	EXPECT_EQ(metrics["cpu_info"]["cores"], 4);
	EXPECT_EQ(metrics["disks"].size(), 1u);
	EXPECT_EQ(metrics["networks"].size(), 1u);
	EXPECT_EQ(metrics["processes"].size(), 2u);
}

TEST(Methods, ProcessByPidFindsKnownProcess) {
	FakeContext fake;
	auto resp = call(fake, "getProcessByPID", {{"pid", 4242}});
	ASSERT_TRUE(resp.result.has_value());
	EXPECT_EQ((*resp.result)["pid"], 4242);
	EXPECT_EQ((*resp.result)["name"], "worker");
}

TEST(Methods, ProcessByPidAcceptsDigitString) {
	FakeContext fake;
	auto resp = call(fake, "getProcessByPID", {{"pid", "1"}});
	ASSERT_TRUE(resp.result.has_value());
	EXPECT_EQ((*resp.result)["name"], "init");
}

TEST(Methods, ProcessByPidReportsNotFound) {
	FakeContext fake;
	auto resp = call(fake, "getProcessByPID", {{"pid", 999999}});
	ASSERT_TRUE(resp.error.has_value());
	EXPECT_EQ(resp.error->code, -32001);
	EXPECT_EQ(resp.error->message, "Process with PID 999999 not found");
}

TEST(Methods, ProcessByPidValidatesParams) {
	FakeContext fake;

	auto missing = call(fake, "getProcessByPID");
	ASSERT_TRUE(missing.error.has_value());
	EXPECT_EQ(missing.error->code, -32602);
	EXPECT_EQ(missing.error->message, "Missing PID parameter");

	for (const nlohmann::json& bad : {nlohmann::json(-1), nlohmann::json("abc"), nlohmann::json(1.5),
	                                  nlohmann::json(4294967296LL), nlohmann::json(true)}) {
		auto resp = call(fake, "getProcessByPID", {{"pid", bad}});
		ASSERT_TRUE(resp.error.has_value()) << bad.dump();
		EXPECT_EQ(resp.error->code, -32602) << bad.dump();
		EXPECT_EQ(resp.error->message, "Invalid PID parameter") << bad.dump();
	}
}

TEST(Methods, CollectorFailureBecomesInternalError) {
	FakeContext fake;
	fake.collector->fail = true;

	auto resp = call(fake, "getCPUInfo");
	ASSERT_TRUE(resp.error.has_value());
	EXPECT_EQ(resp.error->code, -32603);
	EXPECT_EQ(resp.error->message, "Failed to get CPU info: procfs unavailable");

	auto by_pid = call(fake, "getProcessByPID", {{"pid", 1}});
	ASSERT_TRUE(by_pid.error.has_value());
	EXPECT_EQ(by_pid.error->code, -32603);

	fake.collector->fail = false;
	auto recovered = call(fake, "getCPUInfo");
	ASSERT_TRUE(recovered.result.has_value());
	EXPECT_FALSE(recovered.error.has_value());
	EXPECT_EQ((*recovered.result)["cores"], 4);
}

TEST(Methods, MonitoringLatchFlipsOnce) {
	FakeContext fake;

	auto status = call(fake, "getMonitoringStatus");
	ASSERT_TRUE(status.result.has_value());
	EXPECT_EQ((*status.result)["monitoring_active"], false);
	EXPECT_EQ((*status.result)["service_status"], "running");

	auto first = call(fake, "startMonitoring");
	EXPECT_EQ((*first.result)["started"], true);
	EXPECT_EQ((*first.result)["message"], "Monitoring started successfully");

	auto second = call(fake, "startMonitoring");
	EXPECT_EQ((*second.result)["started"], false);
	EXPECT_EQ((*second.result)["message"], "Monitoring already active");

	EXPECT_EQ((*call(fake, "getMonitoringStatus").result)["monitoring_active"], true);

	auto stop = call(fake, "stopMonitoring");
	EXPECT_EQ((*stop.result)["stopped"], true);
	auto stop_again = call(fake, "stopMonitoring");
	EXPECT_EQ((*stop_again.result)["stopped"], false);
	EXPECT_EQ((*stop_again.result)["message"], "Monitoring not active");
}

TEST(Methods, InitializeEchoesProtocolVersion) {
	FakeContext fake;
	auto resp = call(fake, "initialize", {{"protocolVersion", "2099-01-01"}});
	ASSERT_TRUE(resp.result.has_value());
	EXPECT_EQ((*resp.result)["protocolVersion"], "2099-01-01");
	EXPECT_TRUE((*resp.result)["capabilities"]["tools"].is_object());
	EXPECT_EQ((*resp.result)["serverInfo"]["name"], "sysmon-mcp");
	EXPECT_TRUE((*resp.result)["serverInfo"]["version"].is_string());
}

TEST(Methods, InitializeDefaultsProtocolVersion) {
	FakeContext fake;
	auto resp = call(fake, "initialize");
	ASSERT_TRUE(resp.result.has_value());
	EXPECT_EQ((*resp.result)["protocolVersion"], "2025-11-25");
}

TEST(Methods, InitializedReturnsEmptyObject) {
	FakeContext fake;
	auto resp = call(fake, "initialized");
	ASSERT_TRUE(resp.result.has_value());
	EXPECT_TRUE(resp.result->is_object());
	EXPECT_TRUE(resp.result->empty());
}

TEST(Methods, ToolsListAdvertisesCatalogue) {
	FakeContext fake;
	auto resp = call(fake, "tools/list");
	ASSERT_TRUE(resp.result.has_value());
	const auto& tools = (*resp.result)["tools"];
	ASSERT_TRUE(tools.is_array());
	EXPECT_EQ(tools.size(), 11u);
	for (const auto& tool : tools) {
		EXPECT_TRUE(tool["name"].is_string());
		EXPECT_TRUE(tool["description"].is_string());
		EXPECT_EQ(tool["inputSchema"]["type"], "object");
	}
}

TEST(Methods, ToolsCallWrapsResultAsText) {
	FakeContext fake;
	auto resp = call(fake, "tools/call", {{"name", "get_cpu_info"}, {"arguments", nlohmann::json::object()}});
	ASSERT_TRUE(resp.result.has_value());
	const auto& content = (*resp.result)["content"];
	ASSERT_EQ(content.size(), 1u);
	EXPECT_EQ(content[0]["type"], "text");

	auto inner = nlohmann::json::parse(content[0]["text"].get<std::string>());
	EXPECT_GT(inner["cores"].get<int>(), 0);
}

TEST(Methods, ToolsCallForwardsArguments) {
	FakeContext fake;
	auto resp = call(fake, "tools/call", {{"name", "get_process_by_pid"}, {"arguments", {{"pid", 4242}}}});
	ASSERT_TRUE(resp.result.has_value());
	auto inner = nlohmann::json::parse((*resp.result)["content"][0]["text"].get<std::string>());
	EXPECT_EQ(inner["name"], "worker");
}

TEST(Methods, ToolsCallPropagatesInnerError) {
	FakeContext fake;
	auto resp = call(fake, "tools/call", {{"name", "get_process_by_pid"}, {"arguments", {{"pid", 7}}}});
	ASSERT_TRUE(resp.error.has_value());
	EXPECT_EQ(resp.error->code, -32001);
	EXPECT_EQ(std::get<std::string>(resp.id), "t-1");
}

TEST(Methods, ToolsCallRejectsMissingOrUnknownTool) {
	FakeContext fake;

	auto missing = call(fake, "tools/call");
	ASSERT_TRUE(missing.error.has_value());
	EXPECT_EQ(missing.error->code, -32602);
	EXPECT_EQ(missing.error->message, "Missing tool name");

	auto unknown = call(fake, "tools/call", {{"name", "format_disk"}});
	ASSERT_TRUE(unknown.error.has_value());
	EXPECT_EQ(unknown.error->code, -32601);
	EXPECT_EQ(unknown.error->message, "Tool not found");

	auto bad_args = call(fake, "tools/call", {{"name", "get_cpu_info"}, {"arguments", 3}});
	ASSERT_TRUE(bad_args.error.has_value());
	EXPECT_EQ(bad_args.error->code, -32602);
}

TEST(Methods, ToolsCallWithoutArgumentsUsesEmptyParams) {
	FakeContext fake;
	auto resp = call(fake, "tools/call", {{"name", "get_monitoring_status"}});
	ASSERT_TRUE(resp.result.has_value());
	auto inner = nlohmann::json::parse((*resp.result)["content"][0]["text"].get<std::string>());
	EXPECT_EQ(inner["service_status"], "running");
}
