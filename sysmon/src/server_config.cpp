#include "server_config.hpp"

#include <cstring>

namespace sysmon {

namespace {

long parse_number(const std::string& flag, const std::string& text, long min, long max) {
    std::size_t consumed = 0;
    long value = 0;
    try {
        value = std::stol(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(flag + " expects a number, got '" + text + "'");
    }
    if (consumed != text.size() || value < min || value > max) {
        throw ConfigError(flag + " must be between " + std::to_string(min) + " and " + std::to_string(max));
    }
    return value;
}

/// Value of `--name value` or `--name=value`; advances `i` for the split form.
bool take_value(const char* name, int argc, const char* const* argv, int& i, std::string& value) {
    const char* arg = argv[i];
    std::size_t len = std::strlen(name);
    if (std::strncmp(arg, name, len) != 0) {
        return false;
    }
    if (arg[len] == '=') {
        value = arg + len + 1;
        return true;
    }
    if (arg[len] != '\0') {
        return false;
    }
    if (i + 1 >= argc) {
        throw ConfigError(std::string(name) + " requires a value");
    }
    value = argv[++i];
    return true;
}

} // namespace

ServerConfig parse_args(int argc, const char* const* argv) {
    ServerConfig config;
    std::string value;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            config.show_version = true;
            continue;
        }

        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            config.show_help = true;
            continue;
        }

        if (std::strcmp(argv[i], "--stdio") == 0) {
            config.mode = TransportMode::Stdio;
            continue;
        }

        if (take_value("--config", argc, argv, i, value)) {
            config.log_config = value;
            continue;
        }

        if (take_value("--host", argc, argv, i, value)) {
            if (value.empty()) {
                throw ConfigError("--host must not be empty");
            }
            config.host = value;
            continue;
        }

        if (take_value("--port", argc, argv, i, value)) {
            config.port = static_cast<int>(parse_number("--port", value, 1, 65535));
            continue;
        }

        if (take_value("--heartbeat", argc, argv, i, value)) {
            config.heartbeat_interval = std::chrono::seconds(parse_number("--heartbeat", value, 1, 3600));
            continue;
        }

        if (take_value("--workers", argc, argv, i, value)) {
            config.worker_threads = static_cast<std::size_t>(parse_number("--workers", value, 2, 256));
            continue;
        }

        throw ConfigError(std::string("Unknown argument: ") + argv[i]);
    }

    return config;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "  --stdio              serve JSON-RPC on stdin/stdout instead of HTTP\n"
           "  --host <addr>        HTTP bind address (default 0.0.0.0)\n"
           "  --port <n>           HTTP port (default 57996)\n"
           "  --heartbeat <sec>    SSE heartbeat interval (default 10)\n"
           "  --workers <n>        HTTP worker threads, half usable by SSE streams (default 16)\n"
           "  --config <file>      log4cplus properties file (default log4cplus.ini)\n"
           "  -v, --version        print version and exit\n"
           "  -h, --help           print this help and exit\n";
}

} // namespace sysmon
