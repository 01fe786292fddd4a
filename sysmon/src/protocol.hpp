#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace sysmon {

constexpr const char* kJsonRpcVersion = "2.0";

/// JSON-RPC error codes. The -320xx block is specific to the monitor.
enum class ErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
    ProcessNotFound = -32001,
    MonitoringAlreadyStarted = -32002,
    MonitoringNotStarted = -32003,
    SystemCommandFailed = -32004,
    PermissionDenied = -32005,
};

/// Request identifier: absent (notification), text or integer.
using RequestId = std::variant<std::monostate, std::string, std::int64_t>;

inline bool is_notification(const RequestId& id) {
    return std::holds_alternative<std::monostate>(id);
}

struct ErrorObject {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;
};

struct Request {
    std::string jsonrpc = kJsonRpcVersion;
    RequestId id;
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

struct Response {
    std::string jsonrpc = kJsonRpcVersion;
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<ErrorObject> error;
};

namespace method_names {

constexpr const char* kInitialize = "initialize";
constexpr const char* kInitialized = "initialized";
constexpr const char* kToolsList = "tools/list";
constexpr const char* kToolsCall = "tools/call";

constexpr const char* kGetSystemInfo = "getSystemInfo";
constexpr const char* kGetCpuInfo = "getCPUInfo";
constexpr const char* kGetMemoryInfo = "getMemoryInfo";
constexpr const char* kGetDiskInfo = "getDiskInfo";
constexpr const char* kGetNetworkInfo = "getNetworkInfo";
constexpr const char* kGetProcesses = "getProcesses";
constexpr const char* kGetProcessByPid = "getProcessByPID";
constexpr const char* kGetSystemMetrics = "getSystemMetrics";
constexpr const char* kStartMonitoring = "startMonitoring";
constexpr const char* kStopMonitoring = "stopMonitoring";
constexpr const char* kGetMonitoringStatus = "getMonitoringStatus";

} // namespace method_names

} // namespace sysmon
