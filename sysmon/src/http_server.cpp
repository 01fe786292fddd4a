#include "http_server.hpp"

#include "envelope.hpp"
#include "json_codec.hpp"
#include "logger.hpp"
#include "method/method.hpp"
#include "rpc_endpoint.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <cstdio>
#include <random>

namespace sysmon {

namespace {

constexpr const char* kJsonContentType = "application/json";
constexpr auto kStreamPollInterval = std::chrono::milliseconds(100);

nlohmann::json error_to_json(const ErrorObject& error) {
    nlohmann::json out = {{"code", error.code}, {"message", error.message}};
    if (error.data) {
        out["data"] = *error.data;
    }
    return out;
}

bool accepts_event_stream(const httplib::Request& req) {
    return req.get_header_value("Accept").find("text/event-stream") != std::string::npos;
}

} // namespace

std::string generate_request_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    std::uint64_t hi = dist(rng);
    std::uint64_t lo = dist(rng);

    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // variant 10

    char buffer[37] = {0};
    std::snprintf(buffer, sizeof(buffer), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  static_cast<unsigned long long>(hi >> 32),
                  static_cast<unsigned long long>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned long long>(hi & 0xFFFF),
                  static_cast<unsigned long long>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buffer;
}

HttpServer::HttpServer(std::string host, int port, MonitorContext& context,
                       std::chrono::milliseconds heartbeat_interval, std::size_t worker_threads)
    : host_(std::move(host)),
      port_(port),
      context_(context),
      heartbeat_interval_(heartbeat_interval),
      worker_threads_(std::max<std::size_t>(worker_threads, 2)),
      max_event_streams_(worker_threads_ / 2) {
    server_.new_task_queue = [threads = worker_threads_] { return new httplib::ThreadPool(threads); };
    setup_routes();
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::setup_routes() {
    server_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LOG4CPLUS_INFO(http_logger(), req.method << " " << req.path << " (Accept: "
                                                 << req.get_header_value("Accept") << ") -> " << res.status);
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "Unknown error";
        try {
            if (ep) {
                std::rethrow_exception(ep);
            }
        } catch (const std::exception& exc) {
            message = exc.what();
        }
        LOG4CPLUS_ERROR(http_logger(), "Unhandled error on " << req.method << " " << req.path << ": " << message);
        res.status = 500;
        nlohmann::json body = {{"code", static_cast<int>(ErrorCode::InternalError)}, {"message", message}};
        res.set_content(body.dump(), kJsonContentType);
    });

    server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json body = {
            {"status", "healthy"},
            {"service", "MCP System Monitor"},
            {"timestamp", monitor::format_timestamp(monitor::Clock::now())},
        };
        res.set_content(body.dump(), kJsonContentType);
    });

    server_.Post("/", [this](const httplib::Request& req, httplib::Response& res) {
        handle_rpc_post(req, res);
    });
    server_.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
        handle_event_stream(req, res);
    });

    server_.Get("/api/system/info", [this](const httplib::Request&, httplib::Response& res) {
        serve_method(method_names::kGetSystemInfo, nlohmann::json::object(), res);
    });
    server_.Get("/api/system/cpu", [this](const httplib::Request&, httplib::Response& res) {
        serve_method(method_names::kGetCpuInfo, nlohmann::json::object(), res);
    });
    server_.Get("/api/system/memory", [this](const httplib::Request&, httplib::Response& res) {
        serve_method(method_names::kGetMemoryInfo, nlohmann::json::object(), res);
    });
    server_.Get("/api/system/disks", [this](const httplib::Request&, httplib::Response& res) {
        serve_method(method_names::kGetDiskInfo, nlohmann::json::object(), res);
    });
    server_.Get("/api/system/networks", [this](const httplib::Request&, httplib::Response& res) {
        serve_method(method_names::kGetNetworkInfo, nlohmann::json::object(), res);
    });
    server_.Get("/api/system/processes", [this](const httplib::Request&, httplib::Response& res) {
        serve_method(method_names::kGetProcesses, nlohmann::json::object(), res);
    });
    server_.Get(R"(/api/system/processes/(\d+))", [this](const httplib::Request& req, httplib::Response& res) {
        serve_method(method_names::kGetProcessByPid, {{"pid", req.matches[1].str()}}, res, true);
    });
    server_.Get("/api/system/metrics", [this](const httplib::Request&, httplib::Response& res) {
        serve_method(method_names::kGetSystemMetrics, nlohmann::json::object(), res);
    });
    server_.Post("/api/monitoring/start", [this](const httplib::Request&, httplib::Response& res) {
        serve_method(method_names::kStartMonitoring, nlohmann::json::object(), res);
    });
    server_.Post("/api/monitoring/stop", [this](const httplib::Request&, httplib::Response& res) {
        serve_method(method_names::kStopMonitoring, nlohmann::json::object(), res);
    });
    server_.Get("/api/monitoring/status", [this](const httplib::Request&, httplib::Response& res) {
        serve_method(method_names::kGetMonitoringStatus, nlohmann::json::object(), res);
    });
}

void HttpServer::serve_method(const char* method, nlohmann::json params, httplib::Response& res, bool is_pid_lookup) {
    Request request;
    request.id = generate_request_id();
    request.method = method;
    request.params = std::move(params);

    Response response = methods::dispatch(request, context_);
    if (response.result) {
        res.set_content(response.result->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                        kJsonContentType);
        return;
    }

    ErrorObject error = response.error.value_or(
        ErrorObject{static_cast<int>(ErrorCode::InternalError), "Empty response", std::nullopt});
    LOG4CPLUS_ERROR(http_logger(), method << " failed: " << error.code << " " << error.message);
    res.status = (is_pid_lookup && error.code == static_cast<int>(ErrorCode::ProcessNotFound)) ? 404 : 500;
    res.set_content(error_to_json(error).dump(), kJsonContentType);
}

void HttpServer::handle_rpc_post(const httplib::Request& req, httplib::Response& res) {
    Request request;
    try {
        request = codec::decode_request(req.body);
    } catch (const codec::DecodeError& exc) {
        if (exc.code() == ErrorCode::ParseError) {
            LOG4CPLUS_ERROR(http_logger(), "JSON parse error: " << exc.what() << " (" << req.body.size() << " bytes)");
            res.status = 400;
            res.set_content(std::string("JSON parse error: ") + exc.what(), "text/plain");
            return;
        }
        LOG4CPLUS_ERROR(http_logger(), "Invalid JSON-RPC request: " << exc.what());
        res.set_content(codec::encode_response(decode_failure_response(exc)), kJsonContentType);
        return;
    }

    auto reply = handle_request(request, context_);
    if (!reply) {
        res.status = 202;
        return;
    }
    res.set_content(*reply, kJsonContentType);
}

void HttpServer::handle_event_stream(const httplib::Request& req, httplib::Response& res) {
    if (!accepts_event_stream(req)) {
        res.status = 406;
        res.set_content("GET / serves text/event-stream only", "text/plain");
        return;
    }

    // reserve a slot before the stream starts; released with the response
    std::size_t open = open_event_streams_.load();
    do {
        if (open >= max_event_streams_) {
            LOG4CPLUS_WARN(http_logger(), "Refusing SSE connection, " << open << " streams already open");
            res.status = 503;
            res.set_header("Retry-After", "5");
            res.set_content("Too many open event streams", "text/plain");
            return;
        }
    } while (!open_event_streams_.compare_exchange_weak(open, open + 1));

    LOG4CPLUS_INFO(http_logger(), "SSE connection opened (" << open + 1 << "/" << max_event_streams_
                                  << "), heartbeat every " << heartbeat_interval_.count() << " ms");

    res.set_header("Cache-Control", "no-cache");
    res.set_chunked_content_provider("text/event-stream", [this](size_t offset, httplib::DataSink& sink) {
        if (offset == 0) {
            static const std::string kFirstEvent = "data: \n\n";
            return sink.write(kFirstEvent.data(), kFirstEvent.size());
        }

        auto deadline = std::chrono::steady_clock::now() + heartbeat_interval_;
        while (std::chrono::steady_clock::now() < deadline) {
            if (!running_.load()) {
                sink.done();
                return true;
            }
            if (!sink.is_writable()) {
                LOG4CPLUS_INFO(http_logger(), "SSE client disconnected");
                return false;
            }
            std::this_thread::sleep_for(kStreamPollInterval);
        }

        static const std::string kHeartbeat = ": heartbeat\n\n";
        LOG4CPLUS_DEBUG(http_logger(), "SSE heartbeat");
        return sink.write(kHeartbeat.data(), kHeartbeat.size());
    }, [this](bool) {
        open_event_streams_.fetch_sub(1);
        LOG4CPLUS_INFO(http_logger(), "SSE connection closed");
    });
}

bool HttpServer::start() {
    if (running_) {
        return true;
    }

    if (port_ == 0) {
        bound_port_ = server_.bind_to_any_port(host_);
        if (bound_port_ < 0) {
            LOG4CPLUS_ERROR(http_logger(), "Failed to bind " << host_ << " on any port");
            return false;
        }
    } else {
        if (!server_.bind_to_port(host_, port_)) {
            LOG4CPLUS_ERROR(http_logger(), "Failed to bind " << host_ << ":" << port_);
            return false;
        }
        bound_port_ = port_;
    }

    running_ = true;
    listen_thread_ = std::thread([this] {
        if (!server_.listen_after_bind()) {
            LOG4CPLUS_WARN(http_logger(), "HTTP listener exited with an error");
        }
        running_ = false;
    });

    // stop() is a no-op on a server that has not entered its accept loop yet
    while (running_ && !server_.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    if (!running_) {
        listen_thread_.join();
        LOG4CPLUS_ERROR(http_logger(), "HTTP listener on " << host_ << ":" << bound_port_ << " failed to start");
        return false;
    }

    LOG4CPLUS_INFO(http_logger(), "HTTP server listening on " << host_ << ":" << bound_port_ << " with "
                                  << worker_threads_ << " workers");
    return true;
}

void HttpServer::stop() {
    running_ = false;
    server_.stop();
    if (listen_thread_.joinable()) {
        listen_thread_.join();
    }
}

void HttpServer::wait() {
    if (listen_thread_.joinable()) {
        listen_thread_.join();
    }
}

} // namespace sysmon
