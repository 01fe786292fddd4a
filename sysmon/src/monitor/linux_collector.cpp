#include "linux_collector.hpp"

#include "../logger.hpp"

#include <arpa/inet.h>
#include <dirent.h>
#include <ifaddrs.h>
#include <linux/if_packet.h>
#include <mntent.h>
#include <net/if.h>
#include <pwd.h>
#include <sys/socket.h>
#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <map>
#include <memory>
#include <sstream>

#include <log4cplus/loggingmacros.h>

namespace sysmon::monitor {

namespace {

constexpr const char* kNotAvailable = "N/A";

std::optional<std::string> try_read_file(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

std::string read_file(const std::string& path) {
    auto content = try_read_file(path);
    if (!content) {
        throw CollectorError("Failed to read " + path + ": " + std::strerror(errno));
    }
    return *content;
}

std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::uint64_t safe_parse_u64(const std::string& text) {
    try {
        return std::stoull(text);
    } catch (const std::exception&) {
        return 0;
    }
}

double safe_parse_double(const std::string& text) {
    try {
        return std::stod(text);
    } catch (const std::exception&) {
        return 0.0;
    }
}

/// "key<sep> value" lookup in files such as /proc/cpuinfo and /proc/meminfo.
std::optional<std::string> find_field(const std::string& content, const std::string& key, char separator) {
    std::istringstream lines(content);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.compare(0, key.size(), key) != 0) {
            continue;
        }
        auto pos = line.find_first_not_of(" \t", key.size());
        if (pos == std::string::npos || line[pos] != separator) {
            continue;
        }
        return trim(line.substr(pos + 1));
    }
    return std::nullopt;
}

std::uint64_t meminfo_bytes(const std::string& meminfo, const std::string& key) {
    auto value = find_field(meminfo, key, ':');
    if (!value) {
        return 0;
    }
    // values are reported in kB
    return safe_parse_u64(*value) * 1024;
}

double read_uptime_seconds() {
    std::istringstream in(read_file("/proc/uptime"));
    double uptime = 0.0;
    if (!(in >> uptime)) {
        throw CollectorError("Unexpected /proc/uptime format");
    }
    return uptime;
}

std::string user_name(uid_t uid) {
    passwd pwd{};
    passwd* result = nullptr;
    char buffer[1024];
    if (getpwuid_r(uid, &pwd, buffer, sizeof(buffer), &result) == 0 && result) {
        return result->pw_name;
    }
    return std::to_string(uid);
}

struct IfaddrsDeleter {
    void operator()(ifaddrs* ifa) const {
        if (ifa) freeifaddrs(ifa);
    }
};

struct InterfaceAddresses {
    std::string ip_address = kNotAvailable;
    std::string mac_address = kNotAvailable;
};

std::map<std::string, InterfaceAddresses> interface_addresses() {
    std::map<std::string, InterfaceAddresses> result;

    ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        LOG4CPLUS_WARN(monitor_logger(), "getifaddrs failed: " << std::strerror(errno));
        return result;
    }
    std::unique_ptr<ifaddrs, IfaddrsDeleter> guard(ifaddr);

    for (ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr) continue;

        auto& entry = result[ifa->ifa_name];
        if (ifa->ifa_addr->sa_family == AF_INET && entry.ip_address == kNotAvailable) {
            char buf[INET_ADDRSTRLEN] = {0};
            auto* sin = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
            if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
                entry.ip_address = buf;
            }
        } else if (ifa->ifa_addr->sa_family == AF_PACKET) {
            auto* sll = reinterpret_cast<sockaddr_ll*>(ifa->ifa_addr);
            if (sll->sll_halen == 6) {
                char buf[18] = {0};
                std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                              sll->sll_addr[0], sll->sll_addr[1], sll->sll_addr[2],
                              sll->sll_addr[3], sll->sll_addr[4], sll->sll_addr[5]);
                entry.mac_address = buf;
            }
        }
    }
    return result;
}

std::optional<float> read_cpu_temperature() {
    static const char* const kTemperatureFiles[] = {
        "/sys/class/thermal/thermal_zone0/temp",
        "/sys/class/hwmon/hwmon0/temp1_input",
    };
    for (const char* path : kTemperatureFiles) {
        auto content = try_read_file(path);
        if (!content) continue;
        try {
            // millidegrees
            return static_cast<float>(std::stod(*content) / 1000.0);
        } catch (const std::exception&) {
            continue;
        }
    }
    return std::nullopt;
}

} // namespace

LinuxCollector::LinuxCollector()
    : clock_ticks_(::sysconf(_SC_CLK_TCK)),
      page_size_(::sysconf(_SC_PAGESIZE)) {
    if (clock_ticks_ <= 0) clock_ticks_ = 100;
    if (page_size_ <= 0) page_size_ = 4096;
}

SystemInfo LinuxCollector::system_info() {
    SystemInfo info;

    char hostname[256] = {0};
    if (::gethostname(hostname, sizeof(hostname) - 1) != 0) {
        throw CollectorError(std::string("gethostname failed: ") + std::strerror(errno));
    }
    info.hostname = hostname;

    info.os_name = "linux";
    info.os_version = "Unknown";
    if (auto os_release = try_read_file("/etc/os-release")) {
        if (auto name = find_field(*os_release, "NAME", '=')) {
            info.os_name = unquote(*name);
        }
        if (auto version = find_field(*os_release, "VERSION", '=')) {
            info.os_version = unquote(*version);
        }
    }

    utsname uts{};
    if (::uname(&uts) != 0) {
        throw CollectorError(std::string("uname failed: ") + std::strerror(errno));
    }
    info.kernel_version = uts.release;

    info.uptime = static_cast<std::uint64_t>(read_uptime_seconds());
    info.boot_time = Clock::now() - std::chrono::seconds(info.uptime);
    return info;
}

CPUInfo LinuxCollector::cpu_info() {
    CPUInfo info;

    long online = ::sysconf(_SC_NPROCESSORS_ONLN);
    info.cores = online > 0 ? static_cast<std::uint32_t>(online) : 1;

    std::string cpuinfo = read_file("/proc/cpuinfo");
    info.name = find_field(cpuinfo, "model name", ':').value_or("Unknown CPU");
    info.brand = info.name;
    if (auto mhz = find_field(cpuinfo, "cpu MHz", ':')) {
        info.frequency = static_cast<std::uint64_t>(safe_parse_double(*mhz));
    }

    std::istringstream stat(read_file("/proc/stat"));
    std::string label;
    stat >> label;
    if (label != "cpu") {
        throw CollectorError("CPU line not found in /proc/stat");
    }
    // user nice system idle iowait irq softirq steal
    std::uint64_t values[8] = {0};
    std::size_t parsed = 0;
    while (parsed < 8 && stat >> values[parsed]) {
        ++parsed;
    }
    if (parsed < 4) {
        throw CollectorError("Invalid CPU line format in /proc/stat");
    }
    std::uint64_t total = 0;
    for (std::size_t i = 0; i < parsed; ++i) {
        total += values[i];
    }
    std::uint64_t idle = values[3] + (parsed > 4 ? values[4] : 0);
    info.usage_percent = calculate_percentage(total - idle, total);

    info.temperature = read_cpu_temperature();
    return info;
}

MemoryInfo LinuxCollector::memory_info() {
    std::string meminfo = read_file("/proc/meminfo");

    MemoryInfo info;
    info.total = meminfo_bytes(meminfo, "MemTotal");
    info.free = meminfo_bytes(meminfo, "MemFree");
    info.available = meminfo_bytes(meminfo, "MemAvailable");
    info.swap_total = meminfo_bytes(meminfo, "SwapTotal");
    info.swap_free = meminfo_bytes(meminfo, "SwapFree");
    if (info.total == 0) {
        throw CollectorError("MemTotal missing from /proc/meminfo");
    }

    info.used = info.total > info.available ? info.total - info.available : 0;
    info.swap_used = info.swap_total > info.swap_free ? info.swap_total - info.swap_free : 0;
    info.usage_percent = calculate_percentage(info.used, info.total);
    info.swap_usage_percent = calculate_percentage(info.swap_used, info.swap_total);
    return info;
}

std::vector<DiskInfo> LinuxCollector::disks() {
    std::unique_ptr<FILE, int (*)(FILE*)> mounts(::setmntent("/proc/mounts", "r"), ::endmntent);
    if (!mounts) {
        throw CollectorError(std::string("Failed to read /proc/mounts: ") + std::strerror(errno));
    }

    std::vector<DiskInfo> disks;
    mntent entry{};
    char buffer[4096];
    while (::getmntent_r(mounts.get(), &entry, buffer, sizeof(buffer)) != nullptr) {
        struct statvfs vfs{};
        if (::statvfs(entry.mnt_dir, &vfs) != 0) {
            LOG4CPLUS_DEBUG(monitor_logger(), "statvfs(" << entry.mnt_dir << ") failed: " << std::strerror(errno));
            continue;
        }
        if (vfs.f_blocks == 0) {
            // pseudo filesystems (proc, sysfs, cgroup, ...)
            continue;
        }

        DiskInfo disk;
        disk.name = entry.mnt_fsname;
        disk.mount_point = entry.mnt_dir;
        disk.file_system = entry.mnt_type;
        disk.total_space = static_cast<std::uint64_t>(vfs.f_blocks) * vfs.f_frsize;
        disk.free_space = static_cast<std::uint64_t>(vfs.f_bavail) * vfs.f_frsize;
        disk.used_space = static_cast<std::uint64_t>(vfs.f_blocks - vfs.f_bfree) * vfs.f_frsize;
        disk.usage_percent = calculate_percentage(disk.used_space, disk.total_space);
        disks.push_back(std::move(disk));
    }
    return disks;
}

std::vector<NetworkInfo> LinuxCollector::networks() {
    std::istringstream lines(read_file("/proc/net/dev"));
    auto addresses = interface_addresses();

    std::vector<NetworkInfo> networks;
    std::string line;
    // two header lines
    std::getline(lines, line);
    std::getline(lines, line);
    while (std::getline(lines, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string interface = trim(line.substr(0, colon));
        if (interface == "lo") {
            continue;
        }

        std::istringstream fields(line.substr(colon + 1));
        std::uint64_t values[16] = {0};
        std::size_t parsed = 0;
        while (parsed < 16 && fields >> values[parsed]) {
            ++parsed;
        }
        if (parsed < 16) {
            LOG4CPLUS_WARN(monitor_logger(), "Skipping malformed /proc/net/dev line for " << interface);
            continue;
        }

        NetworkInfo info;
        info.interface = interface;
        info.bytes_received = values[0];
        info.packets_received = values[1];
        info.errors_received = values[2];
        info.bytes_transmitted = values[8];
        info.packets_transmitted = values[9];
        info.errors_transmitted = values[10];

        auto it = addresses.find(interface);
        if (it != addresses.end()) {
            info.ip_address = it->second.ip_address;
            info.mac_address = it->second.mac_address;
        } else {
            info.ip_address = kNotAvailable;
            info.mac_address = kNotAvailable;
        }
        networks.push_back(std::move(info));
    }
    return networks;
}

LinuxCollector::ProcessScan LinuxCollector::begin_scan() const {
    ProcessScan scan;
    scan.uptime_seconds = read_uptime_seconds();
    scan.boot_time = Clock::now() - std::chrono::milliseconds(static_cast<std::int64_t>(scan.uptime_seconds * 1000.0));
    scan.mem_total = meminfo_bytes(read_file("/proc/meminfo"), "MemTotal");
    return scan;
}

std::optional<ProcessInfo> LinuxCollector::read_process(std::uint32_t pid, const ProcessScan& scan) const {
    const std::string base = "/proc/" + std::to_string(pid);

    // the process may exit between listing and reading
    auto stat = try_read_file(base + "/stat");
    if (!stat) {
        return std::nullopt;
    }

    // "<pid> (<comm>) <state> <ppid> ..." where comm may contain spaces or ')'
    auto open = stat->find('(');
    auto close = stat->rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        throw CollectorError("Unexpected format in " + base + "/stat");
    }

    ProcessInfo info;
    info.pid = pid;
    info.name = stat->substr(open + 1, close - open - 1);

    std::istringstream fields(stat->substr(close + 1));
    std::vector<std::string> rest;
    std::string field;
    while (fields >> field) {
        rest.push_back(field);
    }
    // rest[0] is field 3 (state) of proc(5)
    if (rest.size() < 22) {
        throw CollectorError("Truncated " + base + "/stat");
    }
    info.status = rest[0];
    std::uint64_t utime = safe_parse_u64(rest[11]);
    std::uint64_t stime = safe_parse_u64(rest[12]);
    info.priority = static_cast<std::int32_t>(std::strtol(rest[15].c_str(), nullptr, 10));
    std::uint64_t start_ticks = safe_parse_u64(rest[19]);
    std::uint64_t rss_pages = safe_parse_u64(rest[21]);

    double started_after_boot = static_cast<double>(start_ticks) / static_cast<double>(clock_ticks_);
    info.start_time = scan.boot_time + std::chrono::milliseconds(static_cast<std::int64_t>(started_after_boot * 1000.0));
    double elapsed = scan.uptime_seconds - started_after_boot;
    if (elapsed > 0.0) {
        double cpu_seconds = static_cast<double>(utime + stime) / static_cast<double>(clock_ticks_);
        info.cpu_usage = static_cast<float>(cpu_seconds / elapsed * 100.0);
    }

    info.memory_usage = rss_pages * static_cast<std::uint64_t>(page_size_);
    info.memory_usage_percent = calculate_percentage(info.memory_usage, scan.mem_total);

    auto cmdline = try_read_file(base + "/cmdline");
    if (cmdline && !cmdline->empty()) {
        std::replace(cmdline->begin(), cmdline->end(), '\0', ' ');
        info.command = trim(*cmdline);
    } else {
        info.command = "[" + info.name + "]";
    }

    info.user = "unknown";
    if (auto status = try_read_file(base + "/status")) {
        if (auto uid_field = find_field(*status, "Uid", ':')) {
            std::istringstream uid_stream(*uid_field);
            uid_t uid = 0;
            if (uid_stream >> uid) {
                info.user = user_name(uid);
            }
        }
    }

    return info;
}

std::vector<ProcessInfo> LinuxCollector::processes() {
    ProcessScan scan = begin_scan();

    std::unique_ptr<DIR, int (*)(DIR*)> proc(::opendir("/proc"), ::closedir);
    if (!proc) {
        throw CollectorError(std::string("Failed to open /proc: ") + std::strerror(errno));
    }

    std::vector<ProcessInfo> processes;
    while (dirent* entry = ::readdir(proc.get())) {
        const char* name = entry->d_name;
        if (!std::all_of(name, name + std::strlen(name), [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        auto pid = static_cast<std::uint32_t>(std::strtoul(name, nullptr, 10));
        if (auto info = read_process(pid, scan)) {
            processes.push_back(std::move(*info));
        }
    }

    std::sort(processes.begin(), processes.end(),
              [](const ProcessInfo& a, const ProcessInfo& b) { return a.pid < b.pid; });
    return processes;
}

std::optional<ProcessInfo> LinuxCollector::process(std::uint32_t pid) {
    if (pid == 0) {
        return std::nullopt;
    }
    return read_process(pid, begin_scan());
}

} // namespace sysmon::monitor
