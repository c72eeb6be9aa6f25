#include "mcp/mcp_tools.hpp"

#include <algorithm>

namespace mcp_tools {

// Global tool registry (module-level, not class-based).
static std::vector<ToolDefinition> registered_tools;

void register_tool(const ToolDefinition &definition) {
    auto existing = std::find_if(registered_tools.begin(), registered_tools.end(),
                                 [&definition](const ToolDefinition &tool) { return tool.name == definition.name; });
    if (existing != registered_tools.end()) {
        *existing = definition;
        return;
    }
    registered_tools.push_back(definition);
}

json build_tools_list_response() {
    json tools_array = json::array();
    for (const auto &tool : registered_tools) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

void dispatch_tool_call(const std::string &tool_name, const json &arguments, boost::asio::io_context &io_context,
                        const CallCompletion &completion) {
    for (const auto &tool : registered_tools) {
        if (tool.name == tool_name) {
            tool.handler(arguments, io_context, completion);
            return;
        }
    }

    completion(make_failure(CallStatus::unknown_tool, "Unknown tool: " + tool_name));
}

const std::vector<ToolDefinition> &get_registered_tools() {
    return registered_tools;
}

CallResult make_text_result(const std::string &text) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = text;

    CallResult result;
    result.status = CallStatus::ok;
    result.payload["content"] = json::array({text_content});
    result.payload["isError"] = false;
    return result;
}

CallResult make_failure(CallStatus status, const std::string &error_message) {
    CallResult result;
    result.status = status;
    result.error_message = error_message;
    return result;
}

} // namespace mcp_tools
