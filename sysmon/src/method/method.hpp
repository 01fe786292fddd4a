#pragma once

#include "../monitor_context.hpp"
#include "../protocol.hpp"

#include <string>
#include <vector>

namespace sysmon::methods {

class MethodRegistry;

/**
 * Route a request to its handler and return the envelope.
 *
 * Never throws: unknown methods become MethodNotFound and handler failures
 * become InternalError. A response is produced for notifications too; the
 * transports decide not to send it.
 */
Response dispatch(const Request& request, MonitorContext& context);

const MethodRegistry& registry();

/**
 * Cross-check the tools/list catalogue against the registry.
 *
 * Returns one line per problem: a tool whose method is not registered, or a
 * registered domain method no tool points at. Empty means consistent.
 */
std::vector<std::string> verify_tool_catalog();

} // namespace sysmon::methods
