#ifndef CLEXEC_TOOL_RUN_COMMAND_HPP
#define CLEXEC_TOOL_RUN_COMMAND_HPP

// The "run_command" tool: runs one local command and returns its exit status and
// output lines as a pretty-printed JSON text block.

#include "command/command_runner.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace tool_run_command {

constexpr const char TOOL_NAME[] = "run_command";

// Arguments of a tools/call checked against the input schema.
struct ParsedArguments {
    bool valid = false;
    command_runner::CommandRequest request;
    std::string error_detail;
};

// Validate {"cmd": non-empty string, "args": string | null (optional)}.
ParsedArguments parse_arguments(const nlohmann::json &arguments);

// JSON Schema advertised in tools/list.
nlohmann::json build_input_schema();

void register_tool();

} // namespace tool_run_command

#endif // CLEXEC_TOOL_RUN_COMMAND_HPP
