#include "method_base.hpp"
#include "method_registry.hpp"

#include "../json_codec.hpp"
#include "../logger.hpp"

#include <cctype>
#include <limits>
#include <mutex>
#include <shared_mutex>
#include <string>

#include <log4cplus/loggingmacros.h>

namespace sysmon::methods {

namespace {

/// Run `collect` under the monitor lock; collector failures become InternalError.
template <typename Collect>
Response collect_locked(MethodContext& ctx, const char* what, Collect&& collect) {
    try {
        std::unique_lock<std::shared_mutex> lock(ctx.context.mutex);
        nlohmann::json result = collect(ctx.context.monitor);
        return make_success(ctx.request.id, std::move(result));
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(rpc_logger(), "Failed to get " << what << ": " << exc.what());
        return make_failure(ctx.request.id, ErrorCode::InternalError,
                            std::string("Failed to get ") + what + ": " + exc.what());
    }
}

/// Accepts a non-negative JSON integer or a string of decimal digits within u32 range.
bool parse_pid(const nlohmann::json& value, std::uint32_t& pid) {
    std::uint64_t parsed = 0;
    if (value.is_number_unsigned()) {
        parsed = value.get<std::uint64_t>();
    } else if (value.is_number_integer()) {
        auto signed_value = value.get<std::int64_t>();
        if (signed_value < 0) {
            return false;
        }
        parsed = static_cast<std::uint64_t>(signed_value);
    } else if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (text.empty() || text.size() > 10) {
            return false;
        }
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        parsed = std::stoull(text);
    } else {
        return false;
    }

    if (parsed > std::numeric_limits<std::uint32_t>::max()) {
        return false;
    }
    pid = static_cast<std::uint32_t>(parsed);
    return true;
}

} // namespace

class GetSystemInfoMethod final : public MethodHandler {
public:
    const char* name() const override { return method_names::kGetSystemInfo; }

    Response handle(MethodContext& ctx) override {
        return collect_locked(ctx, "system info", [](monitor::SystemMonitor& m) -> nlohmann::json {
            return m.get_system_info();
        });
    }
};

class GetCpuInfoMethod final : public MethodHandler {
public:
    const char* name() const override { return method_names::kGetCpuInfo; }

    Response handle(MethodContext& ctx) override {
        return collect_locked(ctx, "CPU info", [](monitor::SystemMonitor& m) -> nlohmann::json {
            return m.get_cpu_info();
        });
    }
};

class GetMemoryInfoMethod final : public MethodHandler {
public:
    const char* name() const override { return method_names::kGetMemoryInfo; }

    Response handle(MethodContext& ctx) override {
        return collect_locked(ctx, "memory info", [](monitor::SystemMonitor& m) -> nlohmann::json {
            return m.get_memory_info();
        });
    }
};

class GetDiskInfoMethod final : public MethodHandler {
public:
    const char* name() const override { return method_names::kGetDiskInfo; }

    Response handle(MethodContext& ctx) override {
        return collect_locked(ctx, "disk info", [](monitor::SystemMonitor& m) -> nlohmann::json {
            return m.get_disk_info();
        });
    }
};

class GetNetworkInfoMethod final : public MethodHandler {
public:
    const char* name() const override { return method_names::kGetNetworkInfo; }

    Response handle(MethodContext& ctx) override {
        return collect_locked(ctx, "network info", [](monitor::SystemMonitor& m) -> nlohmann::json {
            return m.get_network_info();
        });
    }
};

class GetProcessesMethod final : public MethodHandler {
public:
    const char* name() const override { return method_names::kGetProcesses; }

    Response handle(MethodContext& ctx) override {
        return collect_locked(ctx, "processes", [](monitor::SystemMonitor& m) -> nlohmann::json {
            return m.get_processes();
        });
    }
};

class GetProcessByPidMethod final : public MethodHandler {
public:
    const char* name() const override { return method_names::kGetProcessByPid; }

    Response handle(MethodContext& ctx) override {
        auto pid_obj = codec::find_key(ctx.request.params, "pid");
        if (!pid_obj) {
            LOG4CPLUS_ERROR(rpc_logger(), name() << ": pid is required");
            return failure(ctx, ErrorCode::InvalidParams, "Missing PID parameter");
        }

        std::uint32_t pid = 0;
        if (!parse_pid(*pid_obj, pid)) {
            LOG4CPLUS_ERROR(rpc_logger(), name() << ": invalid pid " << pid_obj->dump());
            return failure(ctx, ErrorCode::InvalidParams, "Invalid PID parameter");
        }

        std::optional<monitor::ProcessInfo> process;
        try {
            std::unique_lock<std::shared_mutex> lock(ctx.context.mutex);
            process = ctx.context.monitor.get_process_by_pid(pid);
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(rpc_logger(), "Failed to get process by PID " << pid << ": " << exc.what());
            return failure(ctx, ErrorCode::InternalError, std::string("Failed to get process: ") + exc.what());
        }

        if (!process) {
            return failure(ctx, ErrorCode::ProcessNotFound, "Process with PID " + std::to_string(pid) + " not found");
        }
        return success(ctx, *process);
    }
};

class GetSystemMetricsMethod final : public MethodHandler {
public:
    const char* name() const override { return method_names::kGetSystemMetrics; }

    Response handle(MethodContext& ctx) override {
        return collect_locked(ctx, "system metrics", [](monitor::SystemMonitor& m) -> nlohmann::json {
            return m.get_system_metrics();
        });
    }
};

class StartMonitoringMethod final : public MethodHandler {
public:
    const char* name() const override { return method_names::kStartMonitoring; }

    Response handle(MethodContext& ctx) override {
        std::unique_lock<std::shared_mutex> lock(ctx.context.mutex);
        bool started = ctx.context.monitor.start_monitoring();
        return success(ctx, {
            {"started", started},
            {"message", started ? "Monitoring started successfully" : "Monitoring already active"},
        });
    }
};

class StopMonitoringMethod final : public MethodHandler {
public:
    const char* name() const override { return method_names::kStopMonitoring; }

    Response handle(MethodContext& ctx) override {
        std::unique_lock<std::shared_mutex> lock(ctx.context.mutex);
        bool stopped = ctx.context.monitor.stop_monitoring();
        return success(ctx, {
            {"stopped", stopped},
            {"message", stopped ? "Monitoring stopped successfully" : "Monitoring not active"},
        });
    }
};

class GetMonitoringStatusMethod final : public MethodHandler {
public:
    const char* name() const override { return method_names::kGetMonitoringStatus; }

    Response handle(MethodContext& ctx) override {
        std::unique_lock<std::shared_mutex> lock(ctx.context.mutex);
        return success(ctx, {
            {"monitoring_active", ctx.context.monitor.is_monitoring_active()},
            {"last_update", monitor::format_timestamp(ctx.context.monitor.last_update())},
            {"service_status", "running"},
        });
    }
};

void register_monitor_methods(MethodRegistry& registry) {
    registry.add(std::make_unique<GetSystemInfoMethod>());
    registry.add(std::make_unique<GetCpuInfoMethod>());
    registry.add(std::make_unique<GetMemoryInfoMethod>());
    registry.add(std::make_unique<GetDiskInfoMethod>());
    registry.add(std::make_unique<GetNetworkInfoMethod>());
    registry.add(std::make_unique<GetProcessesMethod>());
    registry.add(std::make_unique<GetProcessByPidMethod>());
    registry.add(std::make_unique<GetSystemMetricsMethod>());
    registry.add(std::make_unique<StartMonitoringMethod>());
    registry.add(std::make_unique<StopMonitoringMethod>());
    registry.add(std::make_unique<GetMonitoringStatusMethod>());
}

} // namespace sysmon::methods
