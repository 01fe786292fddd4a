#pragma once

#include "json_codec.hpp"
#include "monitor_context.hpp"
#include "protocol.hpp"

#include <optional>
#include <string>

namespace sysmon {

/**
 * Dispatch a decoded request and serialize the reply.
 *
 * Returns nothing when the request is a notification: the response is still
 * computed but never serialized, whichever method was called.
 */
std::optional<std::string> handle_request(const Request& request, MonitorContext& context);

/// Error envelope for bytes that did not decode into a request.
Response decode_failure_response(const codec::DecodeError& error);

/// Full byte-to-byte path used by stream transports.
std::optional<std::string> handle_message(const std::string& bytes, MonitorContext& context);

} // namespace sysmon
