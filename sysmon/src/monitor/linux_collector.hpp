#pragma once

#include "collector.hpp"

namespace sysmon::monitor {

/**
 * Collector backed by procfs, statvfs and getifaddrs.
 */
class LinuxCollector final : public Collector {
public:
    LinuxCollector();

    SystemInfo system_info() override;
    CPUInfo cpu_info() override;
    MemoryInfo memory_info() override;
    std::vector<DiskInfo> disks() override;
    std::vector<NetworkInfo> networks() override;
    std::vector<ProcessInfo> processes() override;
    std::optional<ProcessInfo> process(std::uint32_t pid) override;

private:
    struct ProcessScan {
        double uptime_seconds = 0.0;
        Clock::time_point boot_time;
        std::uint64_t mem_total = 0;
    };

    ProcessScan begin_scan() const;
    std::optional<ProcessInfo> read_process(std::uint32_t pid, const ProcessScan& scan) const;

    long clock_ticks_;
    long page_size_;
};

} // namespace sysmon::monitor
