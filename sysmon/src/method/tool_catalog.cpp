#include "tool_catalog.hpp"

#include "../protocol.hpp"

namespace sysmon::methods {

namespace {

constexpr const char* kNoArguments = R"EOF({"type": "object", "properties": {}})EOF";

constexpr const char* kPidArgument = R"EOF(
{
	"type": "object",
	"properties": {
		"pid": {
			"type": "integer",
			"minimum": 0,
			"description": "Process ID to look up"
		}
	},
	"required": ["pid"]
}
)EOF";

} // namespace

const std::vector<ToolDefinition>& tool_catalog() {
    static const std::vector<ToolDefinition> catalog = {
        {"get_system_info", method_names::kGetSystemInfo,
         "Get system information (hostname, OS, kernel version, uptime)", kNoArguments},
        {"get_cpu_info", method_names::kGetCpuInfo,
         "Get CPU information and usage statistics", kNoArguments},
        {"get_memory_info", method_names::kGetMemoryInfo,
         "Get memory and swap usage information", kNoArguments},
        {"get_disk_info", method_names::kGetDiskInfo,
         "Get disk usage information for all mounted filesystems", kNoArguments},
        {"get_network_info", method_names::kGetNetworkInfo,
         "Get network interface information and statistics", kNoArguments},
        {"get_processes", method_names::kGetProcesses,
         "Get list of all running processes", kNoArguments},
        {"get_process_by_pid", method_names::kGetProcessByPid,
         "Get details of a single process by PID", kPidArgument},
        {"get_system_metrics", method_names::kGetSystemMetrics,
         "Get comprehensive system metrics", kNoArguments},
        {"start_monitoring", method_names::kStartMonitoring,
         "Mark continuous monitoring as active", kNoArguments},
        {"stop_monitoring", method_names::kStopMonitoring,
         "Mark continuous monitoring as inactive", kNoArguments},
        {"get_monitoring_status", method_names::kGetMonitoringStatus,
         "Report whether monitoring is active and when data was last collected", kNoArguments},
    };
    return catalog;
}

const ToolDefinition* find_tool(const std::string& name) {
    for (const auto& tool : tool_catalog()) {
        if (name == tool.name) {
            return &tool;
        }
    }
    return nullptr;
}

nlohmann::json tools_list_result() {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : tool_catalog()) {
        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", nlohmann::json::parse(tool.input_schema)},
        });
    }
    return {{"tools", std::move(tools)}};
}

} // namespace sysmon::methods
