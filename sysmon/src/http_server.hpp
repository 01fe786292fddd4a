#pragma once

#include "monitor_context.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

namespace sysmon {

class HttpServer {
public:
    static constexpr std::size_t kDefaultWorkerThreads = 16;

    /**
     * Construct HttpServer.
     *
     * @param host Address to bind, e.g. "0.0.0.0"
     * @param port TCP port; 0 picks a free port (see port())
     * @param context Monitor shared with other transports
     * @param heartbeat_interval Delay between SSE heartbeat comments
     * @param worker_threads Size of the request worker pool, at least 2
     *
     * Each open event stream occupies a worker, so at most half of the pool
     * (see max_event_streams()) serves streams; further `GET /` streams are
     * answered with 503.
     */
    HttpServer(std::string host, int port, MonitorContext& context,
               std::chrono::milliseconds heartbeat_interval = std::chrono::seconds(10),
               std::size_t worker_threads = kDefaultWorkerThreads);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and start serving on a background thread. False when the bind fails.
    bool start();

    /// Stop accepting, close open streams and join the listener thread.
    void stop();

    /// Block until the listener thread exits.
    void wait();

    bool is_running() const { return running_.load(); }

    /// Port actually bound, -1 before start().
    int port() const { return bound_port_; }

    const std::string& host() const { return host_; }

    std::size_t max_event_streams() const { return max_event_streams_; }
    std::size_t open_event_streams() const { return open_event_streams_.load(); }

private:
    std::string host_;
    int port_;
    int bound_port_ = -1;
    MonitorContext& context_;
    std::chrono::milliseconds heartbeat_interval_;
    std::size_t worker_threads_;
    std::size_t max_event_streams_;
    std::atomic<std::size_t> open_event_streams_{0};

    httplib::Server server_;
    std::thread listen_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();
    void serve_method(const char* method, nlohmann::json params, httplib::Response& res, bool is_pid_lookup = false);
    void handle_rpc_post(const httplib::Request& req, httplib::Response& res);
    void handle_event_stream(const httplib::Request& req, httplib::Response& res);
};

/// Random RFC 4122 version 4 UUID, used as the id of synthesized requests.
std::string generate_request_id();

} // namespace sysmon
