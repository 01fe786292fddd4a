#include "types.hpp"

#include <ctime>

namespace sysmon::monitor {

std::string format_timestamp(Clock::time_point tp) {
    std::time_t tt = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buffer[32] = {0};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

float calculate_percentage(std::uint64_t part, std::uint64_t total) {
    if (total == 0) {
        return 0.0f;
    }
    return static_cast<float>(static_cast<double>(part) / static_cast<double>(total) * 100.0);
}

void to_json(nlohmann::json& j, const SystemInfo& info) {
    j = nlohmann::json{
        {"hostname", info.hostname},
        {"os_name", info.os_name},
        {"os_version", info.os_version},
        {"kernel_version", info.kernel_version},
        {"uptime", info.uptime},
        {"boot_time", format_timestamp(info.boot_time)},
    };
}

void to_json(nlohmann::json& j, const CPUInfo& info) {
    j = nlohmann::json{
        {"name", info.name},
        {"brand", info.brand},
        {"frequency", info.frequency},
        {"cores", info.cores},
        {"usage_percent", info.usage_percent},
        {"temperature", nullptr},
    };
    if (info.temperature) {
        j["temperature"] = *info.temperature;
    }
}

void to_json(nlohmann::json& j, const MemoryInfo& info) {
    j = nlohmann::json{
        {"total", info.total},
        {"used", info.used},
        {"free", info.free},
        {"available", info.available},
        {"swap_total", info.swap_total},
        {"swap_used", info.swap_used},
        {"swap_free", info.swap_free},
        {"usage_percent", info.usage_percent},
        {"swap_usage_percent", info.swap_usage_percent},
    };
}

void to_json(nlohmann::json& j, const DiskInfo& info) {
    j = nlohmann::json{
        {"name", info.name},
        {"mount_point", info.mount_point},
        {"file_system", info.file_system},
        {"total_space", info.total_space},
        {"used_space", info.used_space},
        {"free_space", info.free_space},
        {"usage_percent", info.usage_percent},
    };
}

void to_json(nlohmann::json& j, const NetworkInfo& info) {
    j = nlohmann::json{
        {"interface", info.interface},
        {"ip_address", info.ip_address},
        {"mac_address", info.mac_address},
        {"bytes_received", info.bytes_received},
        {"bytes_transmitted", info.bytes_transmitted},
        {"packets_received", info.packets_received},
        {"packets_transmitted", info.packets_transmitted},
        {"errors_received", info.errors_received},
        {"errors_transmitted", info.errors_transmitted},
    };
}

void to_json(nlohmann::json& j, const ProcessInfo& info) {
    j = nlohmann::json{
        {"pid", info.pid},
        {"name", info.name},
        {"command", info.command},
        {"cpu_usage", info.cpu_usage},
        {"memory_usage", info.memory_usage},
        {"memory_usage_percent", info.memory_usage_percent},
        {"status", info.status},
        {"start_time", format_timestamp(info.start_time)},
        {"user", info.user},
        {"priority", info.priority},
    };
}

void to_json(nlohmann::json& j, const SystemMetrics& metrics) {
    j = nlohmann::json{
        {"timestamp", format_timestamp(metrics.timestamp)},
        {"system_info", metrics.system_info},
        {"cpu_info", metrics.cpu_info},
        {"memory_info", metrics.memory_info},
        {"disks", metrics.disks},
        {"networks", metrics.networks},
        {"processes", metrics.processes},
    };
}

} // namespace sysmon::monitor
