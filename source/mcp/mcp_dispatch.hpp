#ifndef CLEXEC_MCP_DISPATCH_HPP
#define CLEXEC_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol version we support.
extern const char PROTOCOL_VERSION[];
extern const char SERVER_NAME[];
extern const char SERVER_VERSION[];

// Receives the JSON-RPC response for a request.
using ResponseHandler = std::function<void(const json &response)>;

// Dispatch a single parsed JSON-RPC message. respond is called exactly once for
// requests, either inline or later from io_context (tools/call), and never for
// notifications.
void dispatch_message(const json &message, boost::asio::io_context &io_context, const ResponseHandler &respond);

// Parse a raw framed message and dispatch it. Unparsable input gets a
// PARSE_ERROR response with a null id.
void dispatch_raw_message(const std::string &raw_message, boost::asio::io_context &io_context,
                          const ResponseHandler &respond);

} // namespace mcp_dispatch

#endif // CLEXEC_MCP_DISPATCH_HPP
