#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace sysmon::methods {

struct ToolDefinition {
    const char* name;
    const char* method;  // JSON-RPC method invoked by tools/call
    const char* description;
    const char* input_schema;
};

const std::vector<ToolDefinition>& tool_catalog();
const ToolDefinition* find_tool(const std::string& name);

/// `{"tools": [{name, description, inputSchema}, ...]}` as returned by tools/list.
nlohmann::json tools_list_result();

} // namespace sysmon::methods
