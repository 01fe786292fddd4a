#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sysmon::monitor {

/// Raised by a collector when host state cannot be read or parsed.
class CollectorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Source of host snapshots.
 *
 * Every call reads fresh state and either returns a value or throws
 * CollectorError. Implementations may block on file reads.
 */
class Collector {
public:
    virtual ~Collector() = default;

    virtual SystemInfo system_info() = 0;
    virtual CPUInfo cpu_info() = 0;
    virtual MemoryInfo memory_info() = 0;
    virtual std::vector<DiskInfo> disks() = 0;
    virtual std::vector<NetworkInfo> networks() = 0;
    virtual std::vector<ProcessInfo> processes() = 0;

    /// Empty when no process has this PID.
    virtual std::optional<ProcessInfo> process(std::uint32_t pid) = 0;
};

} // namespace sysmon::monitor
