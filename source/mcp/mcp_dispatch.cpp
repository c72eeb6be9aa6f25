#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <exception>

// Routes incoming MCP messages to the appropriate handler.

namespace mcp_dispatch {

const char PROTOCOL_VERSION[] = "2024-11-05";
const char SERVER_NAME[] = "cmd-line-executor";
const char SERVER_VERSION[] = "0.1.0";

// Handle the "initialize" request.
static json handle_initialize(const json &request_id, const json &params) {
    (void)params; // We accept any client capabilities.

    json capabilities;
    capabilities["tools"] = json::object();

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

// Handle the "tools/list" request.
static json handle_tools_list(const json &request_id) {
    return json_rpc::build_response(request_id, mcp_tools::build_tools_list_response());
}

static json build_call_response(const json &request_id, const mcp_tools::CallResult &call_result) {
    switch (call_result.status) {
    case mcp_tools::CallStatus::ok:
        return json_rpc::build_response(request_id, call_result.payload);
    case mcp_tools::CallStatus::unknown_tool:
    case mcp_tools::CallStatus::invalid_arguments:
        mcp_stdio::log_message("tools/call rejected: " + call_result.error_message);
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS, call_result.error_message);
    case mcp_tools::CallStatus::internal_error:
        break;
    }
    mcp_stdio::log_message("tools/call failed: " + call_result.error_message);
    return json_rpc::build_error_response(request_id, json_rpc::INTERNAL_ERROR, call_result.error_message);
}

// Handle the "tools/call" request. The response is sent once the tool completes.
static void handle_tools_call(const json &request_id, const json &params, boost::asio::io_context &io_context,
                              const ResponseHandler &respond) {
    if (!params.contains("name") || !params["name"].is_string()) {
        respond(json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                               "Missing or invalid 'name' in tools/call"));
        return;
    }
    std::string tool_name = params["name"].get<std::string>();

    json arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
    }

    debug_log::log("tools/call " + tool_name);

    try {
        mcp_tools::dispatch_tool_call(tool_name, arguments, io_context,
                                      [request_id, respond](mcp_tools::CallResult call_result) {
            respond(build_call_response(request_id, call_result));
        });
    } catch (const std::exception &error) {
        respond(build_call_response(request_id,
                                    mcp_tools::make_failure(mcp_tools::CallStatus::internal_error,
                                                            std::string("Error: ") + error.what())));
    }
}

void dispatch_message(const json &message, boost::asio::io_context &io_context, const ResponseHandler &respond) {
    // Notifications ("notifications/initialized", "notifications/cancelled", ...) get no response.
    if (json_rpc::is_notification(message)) {
        debug_log::log("notification ignored: " + json_rpc::get_method(message));
        return;
    }

    json request_id = json_rpc::get_id(message);
    if (!json_rpc::is_well_formed(message)) {
        respond(json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST, "Invalid request"));
        return;
    }

    std::string method = json_rpc::get_method(message);
    json params = json_rpc::get_params(message);

    if (method == "initialize") {
        respond(handle_initialize(request_id, params));
        return;
    }
    if (method == "ping") {
        respond(json_rpc::build_response(request_id, json::object()));
        return;
    }
    if (method == "tools/list") {
        respond(handle_tools_list(request_id));
        return;
    }
    if (method == "tools/call") {
        handle_tools_call(request_id, params, io_context, respond);
        return;
    }

    respond(json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND, "Unknown method: " + method));
}

void dispatch_raw_message(const std::string &raw_message, boost::asio::io_context &io_context,
                          const ResponseHandler &respond) {
    json parsed_message;
    try {
        parsed_message = json::parse(raw_message);
    } catch (const json::parse_error &error) {
        mcp_stdio::log_message("Failed to parse incoming JSON: " + std::string(error.what()));
        respond(json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error"));
        return;
    }

    dispatch_message(parsed_message, io_context, respond);
}

} // namespace mcp_dispatch
