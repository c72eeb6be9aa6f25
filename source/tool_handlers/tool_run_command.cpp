#include "tool_handlers/tool_run_command.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace tool_run_command {

ParsedArguments parse_arguments(const json &arguments) {
    ParsedArguments parsed;

    if (!arguments.is_object()) {
        parsed.error_detail = "arguments must be an object";
        return parsed;
    }
    if (!arguments.contains("cmd")) {
        parsed.error_detail = "missing required parameter 'cmd'";
        return parsed;
    }
    if (!arguments["cmd"].is_string() || arguments["cmd"].get_ref<const std::string &>().empty()) {
        parsed.error_detail = "'cmd' must be a non-empty string";
        return parsed;
    }
    parsed.request.command = arguments["cmd"].get<std::string>();

    if (arguments.contains("args") && !arguments["args"].is_null()) {
        if (!arguments["args"].is_string()) {
            parsed.error_detail = "'args' must be a string";
            return parsed;
        }
        parsed.request.arguments = arguments["args"].get<std::string>();
    }

    parsed.valid = true;
    return parsed;
}

json build_input_schema() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"cmd", {{"type", "string"}, {"description", "The command to run."}}},
        {"args", {{"type", "string"}, {"description", "The arguments to the command"}}}
    };
    input_schema["required"] = json::array({"cmd"});
    return input_schema;
}

static void handle_run_command(const json &arguments, boost::asio::io_context &io_context,
                               mcp_tools::CallCompletion completion) {
    ParsedArguments parsed = parse_arguments(arguments);
    if (!parsed.valid) {
        completion(mcp_tools::make_failure(mcp_tools::CallStatus::invalid_arguments,
                                           "Invalid arguments: " + parsed.error_detail));
        return;
    }

    debug_log::log("run_command invoked cmd=" + parsed.request.command +
                   (parsed.request.arguments.has_value() ? " args=" + *parsed.request.arguments : ""));

    command_runner::run_async(io_context, parsed.request,
                              [completion = std::move(completion)](command_runner::CommandResult result) {
        mcp_tools::CallResult call_result;
        try {
            call_result = mcp_tools::make_text_result(command_runner::to_json(result).dump(2));
        } catch (const std::exception &error) {
            call_result = mcp_tools::make_failure(mcp_tools::CallStatus::internal_error,
                                                  std::string("Error: ") + error.what());
        }
        completion(std::move(call_result));
    });
}

void register_tool() {
    mcp_tools::register_tool({
        TOOL_NAME,
        "Runs a local command on the command line. Can take arguments.",
        build_input_schema(),
        handle_run_command
    });
}

} // namespace tool_run_command
