#include "method_base.hpp"
#include "method_registry.hpp"
#include "method.hpp"
#include "tool_catalog.hpp"

#include "../json_codec.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace sysmon::methods {

namespace {

constexpr const char* kDefaultProtocolVersion = "2025-11-25";
constexpr const char* kServerName = "sysmon-mcp";

} // namespace

class InitializeMethod final : public MethodHandler {
public:
    const char* name() const override { return method_names::kInitialize; }
    bool is_tool() const override { return false; }

    Response handle(MethodContext& ctx) override {
        // the requested version is echoed back as-is, without checking it
        // against a supported set
        std::string version = kDefaultProtocolVersion;
        if (auto version_obj = codec::find_key(ctx.request.params, "protocolVersion")) {
            version = codec::as_string(*version_obj, kDefaultProtocolVersion);
        }

        LOG4CPLUS_INFO(rpc_logger(), "initialize: protocol version " << version);

        return success(ctx, {
            {"protocolVersion", version},
            {"capabilities", {{"tools", nlohmann::json::object()}}},
            {"serverInfo", {{"name", kServerName}, {"version", VERSION_STRING}}},
        });
    }
};

class InitializedMethod final : public MethodHandler {
public:
    const char* name() const override { return method_names::kInitialized; }
    bool is_tool() const override { return false; }

    Response handle(MethodContext& ctx) override {
        LOG4CPLUS_DEBUG(rpc_logger(), "Client initialized");
        return success(ctx, nlohmann::json::object());
    }
};

class ToolsListMethod final : public MethodHandler {
public:
    const char* name() const override { return method_names::kToolsList; }
    bool is_tool() const override { return false; }

    Response handle(MethodContext& ctx) override {
        return success(ctx, tools_list_result());
    }
};

class ToolsCallMethod final : public MethodHandler {
public:
    const char* name() const override { return method_names::kToolsCall; }
    bool is_tool() const override { return false; }

    Response handle(MethodContext& ctx) override {
        auto name_obj = codec::find_key(ctx.request.params, "name");
        if (!name_obj || !name_obj->is_string()) {
            LOG4CPLUS_ERROR(rpc_logger(), "tools/call: name is required");
            return failure(ctx, ErrorCode::InvalidParams, "Missing tool name");
        }
        std::string tool_name = name_obj->get<std::string>();

        const ToolDefinition* tool = find_tool(tool_name);
        if (!tool) {
            LOG4CPLUS_WARN(rpc_logger(), "tools/call: unknown tool " << tool_name);
            return failure(ctx, ErrorCode::MethodNotFound, "Tool not found");
        }

        Request inner;
        inner.jsonrpc = ctx.request.jsonrpc;
        inner.id = ctx.request.id;
        inner.method = tool->method;
        if (auto args = codec::find_key(ctx.request.params, "arguments")) {
            if (!args->is_null() && !args->is_object()) {
                return failure(ctx, ErrorCode::InvalidParams, "Tool arguments must be an object");
            }
            if (args->is_object()) {
                inner.params = *args;
            }
        }

        LOG4CPLUS_INFO(rpc_logger(), "Calling tool: " << tool_name);

        Response inner_response = dispatch(inner, ctx.context);
        if (inner_response.error || !inner_response.result) {
            return inner_response;
        }

        nlohmann::json content = nlohmann::json::array();
        content.push_back({
            {"type", "text"},
            {"text", inner_response.result->dump(2, ' ', false, nlohmann::json::error_handler_t::replace)},
        });
        return success(ctx, {{"content", std::move(content)}});
    }
};

void register_handshake_methods(MethodRegistry& registry) {
    registry.add(std::make_unique<InitializeMethod>());
    registry.add(std::make_unique<InitializedMethod>());
    registry.add(std::make_unique<ToolsListMethod>());
    registry.add(std::make_unique<ToolsCallMethod>());
}

} // namespace sysmon::methods
