#include "stdio_server.hpp"

#include "framing.hpp"
#include "logger.hpp"
#include "rpc_endpoint.hpp"

#include <log4cplus/loggingmacros.h>

namespace sysmon {

StdioServer::StdioServer(MonitorContext& context, std::istream& in, std::ostream& out)
    : context_(context), in_(in), out_(out) {}

bool StdioServer::run() {
    LOG4CPLUS_INFO(rpc_logger(), "stdio transport ready");

    std::string body;
    while (true) {
        switch (framing::read_frame(in_, body)) {
            case framing::ReadStatus::Message:
                break;
            case framing::ReadStatus::EndOfStream:
                LOG4CPLUS_INFO(rpc_logger(), "stdio input closed after " << messages_handled_ << " messages");
                return true;
            case framing::ReadStatus::Truncated:
                LOG4CPLUS_ERROR(rpc_logger(), "stdio input ended inside a message body");
                return false;
            case framing::ReadStatus::StreamError:
                LOG4CPLUS_ERROR(rpc_logger(), "stdio read error");
                return false;
            case framing::ReadStatus::Oversized:
                LOG4CPLUS_ERROR(rpc_logger(), "stdio message exceeds the size limit");
                return false;
        }

        ++messages_handled_;
        auto reply = handle_message(body, context_);
        if (!reply) {
            continue;
        }
        if (!framing::write_frame(out_, *reply)) {
            LOG4CPLUS_ERROR(rpc_logger(), "stdio write failed");
            return false;
        }
    }
}

} // namespace sysmon
