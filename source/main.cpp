// clexec – command-line executor MCP server
// Entry point: stdio MCP server loop.
//
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr; stdout carries protocol messages only.
//
// Everything runs on one io_context: stdin reads, child process exits and pipe
// reads are all completions on it, so a long-running command never blocks
// reading or answering other requests.

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/signal_set.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <unistd.h>

#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"
#include "utils/env_file.hpp"

using json = nlohmann::json;

namespace {

struct StdinSession {
    explicit StdinSession(boost::asio::io_context &context) : io_context(context), input(context) {}

    boost::asio::io_context &io_context;
    boost::asio::posix::stream_descriptor input;
    std::array<char, 4096> chunk{};
    mcp_stdio::MessageFramer framer;
};

void write_response(const json &response) {
    mcp_stdio::write_message(response.dump(-1, ' ', false, json::error_handler_t::replace));
}

void read_next_chunk(StdinSession &session, boost::asio::signal_set &signals) {
    session.input.async_read_some(
        boost::asio::buffer(session.chunk),
        [&session, &signals](const boost::system::error_code &error, std::size_t bytes_read) {
            std::string message;
            for (std::size_t index = 0; index < bytes_read; ++index) {
                if (session.framer.consume(session.chunk[index], message)) {
                    mcp_dispatch::dispatch_raw_message(message, session.io_context, write_response);
                }
            }

            if (error) {
                if (error == boost::asio::error::eof) {
                    // EOF on stdin means the client disconnected. Calls already
                    // in flight still complete before run() returns.
                    mcp_stdio::log_message("EOF on stdin. Shutting down.");
                } else {
                    mcp_stdio::log_message("stdin read failed: " + error.message());
                }
                signals.cancel();
                return;
            }

            read_next_chunk(session, signals);
        });
}

// Used when stdin cannot be registered with the reactor: each message
// is dispatched and its tool call driven to completion before the next read.
void run_blocking_loop(boost::asio::io_context &io_context) {
    while (true) {
        std::string raw_message = mcp_stdio::read_message(std::cin);
        if (raw_message.empty()) {
            mcp_stdio::log_message("EOF on stdin. Shutting down.");
            break;
        }

        mcp_dispatch::dispatch_raw_message(raw_message, io_context, write_response);
        io_context.restart();
        io_context.run();
    }
}

} // namespace

int main() {
    std::cerr << "[clexec] cmd-line-executor MCP server, build " << __DATE__ << " " << __TIME__ << std::endl;

    std::string env_path = env_file::default_path();
    if (env_file::load(env_path) < 0) {
        debug_log::log("No env file loaded from " + env_path);
    }

    tool_handlers::register_all_tools();

    boost::asio::io_context io_context;
    StdinSession session(io_context);

    mcp_stdio::log_message("Server started. Waiting for MCP messages on stdin.");

    try {
        boost::system::error_code assign_error;
        int input_descriptor = mcp_stdio::duplicate_descriptor(STDIN_FILENO);
        if (input_descriptor >= 0) {
            session.input.assign(input_descriptor, assign_error);
        }

        if (input_descriptor < 0 || assign_error) {
            if (input_descriptor >= 0) {
                ::close(input_descriptor);
            }
            debug_log::log("stdin is not pollable, reading messages synchronously");
            run_blocking_loop(io_context);
        } else {
            boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
            signals.async_wait([&io_context](const boost::system::error_code &error, int signal_number) {
                if (error) {
                    return; // cancelled after EOF
                }
                mcp_stdio::log_message("Signal " + std::to_string(signal_number) + " received. Shutting down.");
                io_context.stop();
            });

            read_next_chunk(session, signals);
            io_context.run();
        }
    } catch (const std::exception &error) {
        mcp_stdio::log_message(std::string("Fatal error in event loop: ") + error.what());
        return 1;
    }

    mcp_stdio::log_message("Server shut down.");
    return 0;
}
