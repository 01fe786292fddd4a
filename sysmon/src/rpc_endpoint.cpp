#include "rpc_endpoint.hpp"

#include "envelope.hpp"
#include "logger.hpp"
#include "method/method.hpp"

#include <log4cplus/loggingmacros.h>

namespace sysmon {

std::optional<std::string> handle_request(const Request& request, MonitorContext& context) {
    Response response = methods::dispatch(request, context);
    if (is_notification(request.id)) {
        LOG4CPLUS_DEBUG(rpc_logger(), "Notification " << request.method << " processed, no response sent");
        return std::nullopt;
    }
    return codec::encode_response(response);
}

Response decode_failure_response(const codec::DecodeError& error) {
    if (error.code() == ErrorCode::ParseError) {
        return make_failure(error.id(), ErrorCode::ParseError, "Parse error");
    }
    return make_failure(error.id(), error.code(), error.what());
}

std::optional<std::string> handle_message(const std::string& bytes, MonitorContext& context) {
    Request request;
    try {
        request = codec::decode_request(bytes);
    } catch (const codec::DecodeError& exc) {
        LOG4CPLUS_ERROR(rpc_logger(), "Failed to decode JSON-RPC request: " << exc.what());
        return codec::encode_response(decode_failure_response(exc));
    }
    return handle_request(request, context);
}

} // namespace sysmon
