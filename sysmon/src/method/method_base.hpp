#pragma once

#include "../envelope.hpp"
#include "../monitor_context.hpp"
#include "../protocol.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace sysmon::methods {

struct MethodContext {
	const Request& request;
	MonitorContext& context;
};

class MethodHandler {
public:
	virtual ~MethodHandler() = default;
	virtual const char* name() const = 0;
	virtual Response handle(MethodContext& ctx) = 0;

	/// Domain methods are reachable through tools/call; handshake methods are not.
	virtual bool is_tool() const { return true; }

protected:
	Response success(const MethodContext& ctx, nlohmann::json result) const;
	Response failure(const MethodContext& ctx, ErrorCode code, const std::string& message) const;
};

} // namespace sysmon::methods
