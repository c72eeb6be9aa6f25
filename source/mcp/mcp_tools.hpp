#ifndef CLEXEC_MCP_TOOLS_HPP
#define CLEXEC_MCP_TOOLS_HPP

// MCP tool registry: registration, listing, and dispatch of tool calls.

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <functional>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// How a tools/call ended. Anything but ok is reported to the client as a
// JSON-RPC error rather than as tool output.
enum class CallStatus {
    ok,
    unknown_tool,
    invalid_arguments,
    internal_error,
};

// Outcome of a tools/call. payload is the MCP result (content + isError) when
// status is ok; error_message describes the failure otherwise.
struct CallResult {
    CallStatus status = CallStatus::ok;
    json payload;
    std::string error_message;
};

using CallCompletion = std::function<void(CallResult result)>;

// A tool handler receives the arguments JSON and reports exactly once through
// the completion, either inline (validation failures) or later from io_context.
using ToolHandler = std::function<void(const json &arguments, boost::asio::io_context &io_context,
                                       CallCompletion completion)>;

// Description of a registered tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    ToolHandler handler;
};

// Register a tool. A tool with the same name is replaced, never duplicated.
void register_tool(const ToolDefinition &definition);

// Build the response payload for tools/list.
json build_tools_list_response();

// Dispatch a tools/call request. Unknown names complete inline with
// CallStatus::unknown_tool and no handler runs.
void dispatch_tool_call(const std::string &tool_name, const json &arguments, boost::asio::io_context &io_context,
                        const CallCompletion &completion);

// Get all registered tool definitions (for testing or introspection).
const std::vector<ToolDefinition> &get_registered_tools();

// Helpers for building outcomes.
CallResult make_text_result(const std::string &text);
CallResult make_failure(CallStatus status, const std::string &error_message);

} // namespace mcp_tools

#endif // CLEXEC_MCP_TOOLS_HPP
