#pragma once

#include "monitor/system_monitor.hpp"

#include <memory>
#include <shared_mutex>

namespace sysmon {

/**
 * State shared by every transport.
 *
 * All monitor operations take the exclusive side of `mutex`, reads included,
 * because each call also moves the monitor's last-update timestamp.
 */
struct MonitorContext {
    explicit MonitorContext(std::unique_ptr<monitor::Collector> collector)
        : monitor(std::move(collector)) {}

    std::shared_mutex mutex;
    monitor::SystemMonitor monitor;
};

} // namespace sysmon
