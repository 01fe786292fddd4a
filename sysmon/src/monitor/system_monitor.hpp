#pragma once

#include "collector.hpp"

#include <memory>

namespace sysmon::monitor {

/**
 * Monitor capability consumed by the method handlers.
 *
 * Wraps a Collector, records when data was last requested and holds the
 * "monitoring active" latch. Not thread-safe: callers serialize access
 * through MonitorContext::mutex.
 */
class SystemMonitor {
public:
    explicit SystemMonitor(std::unique_ptr<Collector> collector);

    SystemInfo get_system_info();
    CPUInfo get_cpu_info();
    MemoryInfo get_memory_info();
    std::vector<DiskInfo> get_disk_info();
    std::vector<NetworkInfo> get_network_info();
    std::vector<ProcessInfo> get_processes();
    std::optional<ProcessInfo> get_process_by_pid(std::uint32_t pid);
    SystemMetrics get_system_metrics();

    /// True when the latch flipped, false when monitoring was already on.
    bool start_monitoring();
    /// True when the latch flipped, false when monitoring was already off.
    bool stop_monitoring();

    bool is_monitoring_active() const { return monitoring_active_; }
    Clock::time_point last_update() const { return last_update_; }

private:
    void refresh();

    std::unique_ptr<Collector> collector_;
    bool monitoring_active_ = false;
    Clock::time_point last_update_;
};

} // namespace sysmon::monitor
