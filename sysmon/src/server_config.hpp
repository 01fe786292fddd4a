#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace sysmon {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class TransportMode {
    Http,
    Stdio,
};

struct ServerConfig {
    TransportMode mode = TransportMode::Http;
    std::string host = "0.0.0.0";
    int port = 57996;
    std::string log_config = "log4cplus.ini";
    std::chrono::seconds heartbeat_interval{10};
    std::size_t worker_threads = 16;  // HTTP request pool; half may hold SSE streams
    bool show_version = false;
    bool show_help = false;
};

/**
 * Parse command-line flags.
 *
 * Accepts `--flag value` and `--flag=value` forms. Throws ConfigError on an
 * unknown flag, a missing value or a value out of range.
 */
ServerConfig parse_args(int argc, const char* const* argv);

std::string usage(const std::string& program);

} // namespace sysmon
