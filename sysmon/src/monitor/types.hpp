#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sysmon::monitor {

using Clock = std::chrono::system_clock;

struct SystemInfo {
    std::string hostname;
    std::string os_name;
    std::string os_version;
    std::string kernel_version;
    std::uint64_t uptime = 0;  // seconds
    Clock::time_point boot_time;
};

struct CPUInfo {
    std::string name;
    std::string brand;
    std::uint64_t frequency = 0;  // MHz
    std::uint32_t cores = 0;
    float usage_percent = 0.0f;
    std::optional<float> temperature;  // Celsius
};

struct MemoryInfo {
    std::uint64_t total = 0;
    std::uint64_t used = 0;
    std::uint64_t free = 0;
    std::uint64_t available = 0;
    std::uint64_t swap_total = 0;
    std::uint64_t swap_used = 0;
    std::uint64_t swap_free = 0;
    float usage_percent = 0.0f;
    float swap_usage_percent = 0.0f;
};

struct DiskInfo {
    std::string name;
    std::string mount_point;
    std::string file_system;
    std::uint64_t total_space = 0;
    std::uint64_t used_space = 0;
    std::uint64_t free_space = 0;
    float usage_percent = 0.0f;
};

struct NetworkInfo {
    std::string interface;
    std::string ip_address;
    std::string mac_address;
    std::uint64_t bytes_received = 0;
    std::uint64_t bytes_transmitted = 0;
    std::uint64_t packets_received = 0;
    std::uint64_t packets_transmitted = 0;
    std::uint64_t errors_received = 0;
    std::uint64_t errors_transmitted = 0;
};

struct ProcessInfo {
    std::uint32_t pid = 0;
    std::string name;
    std::string command;
    float cpu_usage = 0.0f;
    std::uint64_t memory_usage = 0;  // resident bytes
    float memory_usage_percent = 0.0f;
    std::string status;
    Clock::time_point start_time;
    std::string user;
    std::int32_t priority = 0;
};

struct SystemMetrics {
    Clock::time_point timestamp;
    SystemInfo system_info;
    CPUInfo cpu_info;
    MemoryInfo memory_info;
    std::vector<DiskInfo> disks;
    std::vector<NetworkInfo> networks;
    std::vector<ProcessInfo> processes;
};

/// ISO-8601 UTC, e.g. 2026-01-31T16:51:25Z
std::string format_timestamp(Clock::time_point tp);

float calculate_percentage(std::uint64_t part, std::uint64_t total);

void to_json(nlohmann::json& j, const SystemInfo& info);
void to_json(nlohmann::json& j, const CPUInfo& info);
void to_json(nlohmann::json& j, const MemoryInfo& info);
void to_json(nlohmann::json& j, const DiskInfo& info);
void to_json(nlohmann::json& j, const NetworkInfo& info);
void to_json(nlohmann::json& j, const ProcessInfo& info);
void to_json(nlohmann::json& j, const SystemMetrics& metrics);

} // namespace sysmon::monitor
