#ifndef CLEXEC_JSON_RPC_HPP
#define CLEXEC_JSON_RPC_HPP

// JSON-RPC 2.0 envelope helpers for the MCP stdio protocol.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Extract method name from a request/notification. Returns empty if missing or not a string.
std::string get_method(const json &message);

// Extract the id. Returns a null json value if missing.
json get_id(const json &message);

// Extract params. Returns an empty object if missing or not an object.
json get_params(const json &message);

// A message with a string method and no id is a notification and never gets a response.
bool is_notification(const json &message);

// True if the message is an object carrying "jsonrpc": "2.0" and a string method.
bool is_well_formed(const json &message);

} // namespace json_rpc

#endif // CLEXEC_JSON_RPC_HPP
