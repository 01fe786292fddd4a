#include "http_server.hpp"
#include "logger.hpp"
#include "method/method.hpp"
#include "monitor/linux_collector.hpp"
#include "monitor_context.hpp"
#include "server_config.hpp"
#include "stdio_server.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    sysmon::ServerConfig config;
    try {
        config = sysmon::parse_args(argc, argv);
    } catch (const sysmon::ConfigError& exc) {
        std::cerr << exc.what() << "\n" << sysmon::usage(argv[0]);
        return 2;
    }

    if (config.show_help) {
        std::cout << sysmon::usage(argv[0]);
        return 0;
    }

    if (config.show_version) {
        std::cout << "Version: " << VERSION_STRING << std::endl;
        std::cout << "Commit: " << GIT_VERSION_STRING << std::endl;
        std::cout << "Build Time: " << BUILD_TIMESTAMP << std::endl;
        return 0;
    }

    init_logging(config.log_config);
    const bool use_stdio = config.mode == sysmon::TransportMode::Stdio;
    if (use_stdio) {
        log4cplus::Logger::getRoot().setLogLevel(log4cplus::ERROR_LOG_LEVEL);
    }

    LOG4CPLUS_INFO(core_logger(), "sysmon_mcp starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << VERSION_STRING << ", Commit: " << GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Build Time: " << BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(core_logger(), "Transport: " << (use_stdio ? "stdio" : "http"));

    auto problems = sysmon::methods::verify_tool_catalog();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            LOG4CPLUS_FATAL(core_logger(), "Tool catalogue mismatch: " << problem);
        }
        return 1;
    }

    sysmon::MonitorContext context(std::make_unique<sysmon::monitor::LinuxCollector>());

    if (use_stdio) {
        std::ios::sync_with_stdio(false);
        sysmon::StdioServer server(context, std::cin, std::cout);
        if (!server.run()) {
            LOG4CPLUS_FATAL(core_logger(), "stdio transport failed");
            return 1;
        }
        return 0;
    }

    sysmon::HttpServer server(config.host, config.port, context, config.heartbeat_interval, config.worker_threads);
    if (!server.start()) {
        LOG4CPLUS_FATAL(core_logger(), "Failed to start HTTP server on " << config.host << ":" << config.port);
        return 1;
    }

    LOG4CPLUS_INFO(core_logger(), "HTTP server started at " << server.host() << ":" << server.port()
                                  << ", up to " << server.max_event_streams() << " event streams");
    server.wait();
    return 0;
}
