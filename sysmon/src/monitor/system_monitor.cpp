#include "system_monitor.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <stdexcept>

namespace sysmon::monitor {

SystemMonitor::SystemMonitor(std::unique_ptr<Collector> collector)
    : collector_(std::move(collector)),
      last_update_(Clock::now()) {
    if (!collector_) {
        throw std::invalid_argument("SystemMonitor requires a collector");
    }
}

void SystemMonitor::refresh() {
    last_update_ = Clock::now();
}

SystemInfo SystemMonitor::get_system_info() {
    refresh();
    return collector_->system_info();
}

CPUInfo SystemMonitor::get_cpu_info() {
    refresh();
    return collector_->cpu_info();
}

MemoryInfo SystemMonitor::get_memory_info() {
    refresh();
    return collector_->memory_info();
}

std::vector<DiskInfo> SystemMonitor::get_disk_info() {
    refresh();
    return collector_->disks();
}

std::vector<NetworkInfo> SystemMonitor::get_network_info() {
    refresh();
    return collector_->networks();
}

std::vector<ProcessInfo> SystemMonitor::get_processes() {
    refresh();
    return collector_->processes();
}

std::optional<ProcessInfo> SystemMonitor::get_process_by_pid(std::uint32_t pid) {
    refresh();
    return collector_->process(pid);
}

SystemMetrics SystemMonitor::get_system_metrics() {
    refresh();

    SystemMetrics metrics;
    metrics.system_info = collector_->system_info();
    metrics.cpu_info = collector_->cpu_info();
    metrics.memory_info = collector_->memory_info();
    metrics.disks = collector_->disks();
    metrics.networks = collector_->networks();
    metrics.processes = collector_->processes();
    metrics.timestamp = Clock::now();
    return metrics;
}

bool SystemMonitor::start_monitoring() {
    if (monitoring_active_) {
        LOG4CPLUS_INFO(monitor_logger(), "Monitoring already active");
        return false;
    }
    monitoring_active_ = true;
    LOG4CPLUS_INFO(monitor_logger(), "Monitoring started");
    return true;
}

bool SystemMonitor::stop_monitoring() {
    if (!monitoring_active_) {
        LOG4CPLUS_INFO(monitor_logger(), "Monitoring not active");
        return false;
    }
    monitoring_active_ = false;
    LOG4CPLUS_INFO(monitor_logger(), "Monitoring stopped");
    return true;
}

} // namespace sysmon::monitor
