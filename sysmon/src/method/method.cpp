#include "method.hpp"

#include "method_base.hpp"
#include "method_registry.hpp"
#include "tool_catalog.hpp"
#include "../envelope.hpp"
#include "../json_codec.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <set>

namespace sysmon::methods {

namespace {

MethodRegistry& get_registry() {
	static MethodRegistry registry = [] {
		MethodRegistry reg;
		register_handshake_methods(reg);
		register_monitor_methods(reg);
		return reg;
	}();

	return registry;
}

} // namespace

Response MethodHandler::success(const MethodContext& ctx, nlohmann::json result) const {
	return make_success(ctx.request.id, std::move(result));
}

Response MethodHandler::failure(const MethodContext& ctx, ErrorCode code, const std::string& message) const {
	return make_failure(ctx.request.id, code, message);
}

const MethodRegistry& registry() {
	return get_registry();
}

Response dispatch(const Request& request, MonitorContext& context) {
	LOG4CPLUS_INFO(rpc_logger(), "RPC method: " << request.method << " id=" << codec::id_to_json(request.id).dump());

	MethodHandler* handler = get_registry().find(request.method);
	if (!handler) {
		LOG4CPLUS_WARN(rpc_logger(), "Unknown method: " << request.method);
		return make_failure(request.id, ErrorCode::MethodNotFound, "Method not found");
	}

	MethodContext ctx{request, context};
	try {
		return handler->handle(ctx);
	} catch (const std::exception& exc) {
		LOG4CPLUS_ERROR(rpc_logger(), request.method << " failed: " << exc.what());
		return make_failure(request.id, ErrorCode::InternalError, std::string("Internal error: ") + exc.what());
	}
}

std::vector<std::string> verify_tool_catalog() {
	std::vector<std::string> problems;
	std::set<std::string> covered;

	for (const auto& tool : tool_catalog()) {
		const MethodHandler* handler = get_registry().find(tool.method);
		if (!handler) {
			problems.push_back(std::string("tool ") + tool.name + " maps to unregistered method " + tool.method);
			continue;
		}
		if (!handler->is_tool()) {
			problems.push_back(std::string("tool ") + tool.name + " maps to protocol method " + tool.method);
			continue;
		}
		if (!covered.insert(tool.method).second) {
			problems.push_back(std::string("method ") + tool.method + " is listed by more than one tool");
		}
	}

	for (const MethodHandler* handler : get_registry().handlers()) {
		if (handler->is_tool() && covered.count(handler->name()) == 0) {
			problems.push_back(std::string("method ") + handler->name() + " has no tools/list entry");
		}
	}

	return problems;
}

} // namespace sysmon::methods
