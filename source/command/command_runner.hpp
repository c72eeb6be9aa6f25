#ifndef CLEXEC_COMMAND_RUNNER_HPP
#define CLEXEC_COMMAND_RUNNER_HPP

// Command runner: spawns one local command (no shell), waits for it on an
// io_context and returns its exit status and captured output as a CommandResult.
//
// The argument string is passed to the program as a single argv entry. It is never
// split on whitespace, quoted or glob-expanded: run("echo", "a b") executes
// argv = ["echo", "a b"].

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace command_runner {

// Validated input of one run.
struct CommandRequest {
    std::string command;                  // non-empty
    std::optional<std::string> arguments; // passed as one token when non-empty
};

// Outcome of one run. Launch failures are reported here too, with exit_code 1 and
// a single stderr line, never as an exception.
struct CommandResult {
    std::string command;
    std::optional<std::string> arguments;
    int exit_code = 0;
    std::vector<std::string> stdout_lines;
    std::vector<std::string> stderr_lines;
};

using CompletionHandler = std::function<void(CommandResult result)>;

// Exit code reported when the process could not be started at all.
constexpr int LAUNCH_FAILURE_EXIT_CODE = 1;

// argv for the request: [command] or [command, arguments].
std::vector<std::string> build_argument_vector(const CommandRequest &request);

// Decode captured bytes: sanitize to UTF-8, strip trailing whitespace,
// split on '\n' and drop empty lines.
std::vector<std::string> split_output_lines(const std::string &raw_output);

// Result for a process that never ran.
CommandResult make_launch_failure(const CommandRequest &request, const std::string &description);

// Start the command on io_context. The completion is always invoked from
// io_context (never inline), exactly once, after the child has been reaped and
// both pipes have been drained, or after a launch failure.
void run_async(boost::asio::io_context &io_context, const CommandRequest &request,
               CompletionHandler completion);

// Blocking convenience: runs the command on a private io_context.
CommandResult run(const CommandRequest &request);
CommandResult run(const std::string &command, const std::optional<std::string> &arguments);

// Field-labeled form sent to MCP clients: cmd, args, status_code, stdout, stderr.
nlohmann::ordered_json to_json(const CommandResult &result);

} // namespace command_runner

#endif // CLEXEC_COMMAND_RUNNER_HPP
