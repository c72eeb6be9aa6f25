#include "command/command_runner.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/process.hpp>

#include <memory>
#include <sys/wait.h>
#include <system_error>
#include <utility>

namespace command_runner {

namespace bp = boost::process;

namespace {

// State of one run, shared by its three completions: stdout EOF, stderr EOF and
// process exit. The last of them to arrive builds the result.
struct Execution {
    explicit Execution(boost::asio::io_context &io_context)
        : stdout_pipe(io_context), stderr_pipe(io_context) {}

    CommandRequest request;
    CompletionHandler completion;
    bp::async_pipe stdout_pipe;
    bp::async_pipe stderr_pipe;
    std::string stdout_data;
    std::string stderr_data;
    bp::child child;
    int pending_events = 3;
    int exit_code = 0;
};

// Signalled processes report the negated signal number.
int decode_exit_status(int native_status) {
    if (WIFEXITED(native_status)) {
        return WEXITSTATUS(native_status);
    }
    if (WIFSIGNALED(native_status)) {
        return -WTERMSIG(native_status);
    }
    return 0;
}

std::string join_for_log(const std::vector<std::string> &argument_vector) {
    std::string joined;
    for (const auto &argument : argument_vector) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += "\"" + argument + "\"";
    }
    return "[" + joined + "]";
}

void complete_step(const std::shared_ptr<Execution> &execution) {
    execution->pending_events--;
    if (execution->pending_events > 0) {
        return;
    }

    CommandResult result;
    result.command = execution->request.command;
    result.arguments = execution->request.arguments;
    result.exit_code = execution->exit_code;
    result.stdout_lines = split_output_lines(execution->stdout_data);
    result.stderr_lines = split_output_lines(execution->stderr_data);

    debug_log::log("command_runner", "'" + result.command + "' exited with " + std::to_string(result.exit_code) +
                                         " (" + std::to_string(result.stdout_lines.size()) + " stdout, " +
                                         std::to_string(result.stderr_lines.size()) + " stderr lines)");

    CompletionHandler completion = std::move(execution->completion);
    completion(std::move(result));
}

void start_read(const std::shared_ptr<Execution> &execution, bp::async_pipe &pipe, std::string &buffer,
                const char *stream_name) {
    boost::asio::async_read(pipe, boost::asio::dynamic_buffer(buffer),
                            [execution, stream_name](const boost::system::error_code &error, std::size_t) {
                                if (error && error != boost::asio::error::eof) {
                                    debug_log::log("command_runner", std::string(stream_name) +
                                                                         " read ended early: " + error.message());
                                }
                                complete_step(execution);
                            });
}

void post_failure(boost::asio::io_context &io_context, const CommandRequest &request,
                  const std::string &description, CompletionHandler completion) {
    debug_log::log("command_runner", description);
    CommandResult failure = make_launch_failure(request, description);
    boost::asio::post(io_context, [completion = std::move(completion), failure = std::move(failure)]() mutable {
        completion(std::move(failure));
    });
}

} // namespace

std::vector<std::string> build_argument_vector(const CommandRequest &request) {
    std::vector<std::string> argument_vector;
    argument_vector.push_back(request.command);
    if (request.arguments.has_value() && !request.arguments->empty()) {
        argument_vector.push_back(*request.arguments);
    }
    return argument_vector;
}

std::vector<std::string> split_output_lines(const std::string &raw_output) {
    std::vector<std::string> lines;
    std::string text = utf8_sanitize::sanitize(raw_output);

    size_t last = text.find_last_not_of(" \t\n\v\f\r");
    if (last == std::string::npos) {
        return lines;
    }
    text.erase(last + 1);

    size_t line_start = 0;
    while (line_start <= text.size()) {
        size_t line_end = text.find('\n', line_start);
        if (line_end == std::string::npos) {
            line_end = text.size();
        }
        if (line_end > line_start) {
            lines.push_back(text.substr(line_start, line_end - line_start));
        }
        line_start = line_end + 1;
    }
    return lines;
}

CommandResult make_launch_failure(const CommandRequest &request, const std::string &description) {
    CommandResult result;
    result.command = request.command;
    result.arguments = request.arguments;
    result.exit_code = LAUNCH_FAILURE_EXIT_CODE;
    result.stderr_lines.push_back(utf8_sanitize::sanitize(description));
    return result;
}

void run_async(boost::asio::io_context &io_context, const CommandRequest &request,
               CompletionHandler completion) {
    std::vector<std::string> argument_vector = build_argument_vector(request);
    debug_log::log("command_runner", "spawning argv=" + join_for_log(argument_vector));

    if (request.command.empty()) {
        post_failure(io_context, request, "Failed to start command: command must not be empty",
                     std::move(completion));
        return;
    }

    // Bare names are looked up on PATH; anything with a slash is taken as a path.
    if (request.command.find('/') == std::string::npos && bp::search_path(request.command).empty()) {
        post_failure(io_context, request,
                     "Failed to start '" + request.command + "': " +
                         std::make_error_code(std::errc::no_such_file_or_directory).message(),
                     std::move(completion));
        return;
    }

    std::shared_ptr<Execution> execution;
    try {
        execution = std::make_shared<Execution>(io_context);
        execution->request = request;
        execution->child = bp::child(
            bp::args = argument_vector,
            bp::std_out > execution->stdout_pipe,
            bp::std_err > execution->stderr_pipe,
            bp::std_in < bp::null,
            io_context,
            bp::on_exit([execution, &io_context](int, const std::error_code &error) {
                // A child that is already gone gets this handler inside the bp::child
                // constructor, before execution->child is assigned. The status is read
                // from a posted handler so it sees the assigned child.
                boost::asio::post(io_context, [execution, error]() {
                    if (error) {
                        debug_log::log("command_runner", "no exit status for '" + execution->request.command +
                                                             "': " + error.message());
                        execution->exit_code = 0;
                    } else {
                        execution->exit_code = decode_exit_status(execution->child.native_exit_code());
                    }
                    complete_step(execution);
                });
            }));
    } catch (const bp::process_error &error) {
        post_failure(io_context, request, "Failed to start '" + request.command + "': " + error.what(),
                     std::move(completion));
        return;
    } catch (const std::exception &error) {
        post_failure(io_context, request, std::string("Unexpected error: ") + error.what(), std::move(completion));
        return;
    }

    execution->completion = std::move(completion);
    start_read(execution, execution->stdout_pipe, execution->stdout_data, "stdout");
    start_read(execution, execution->stderr_pipe, execution->stderr_data, "stderr");
}

CommandResult run(const CommandRequest &request) {
    boost::asio::io_context io_context;
    CommandResult result;
    run_async(io_context, request, [&result](CommandResult completed) { result = std::move(completed); });
    io_context.run();
    return result;
}

CommandResult run(const std::string &command, const std::optional<std::string> &arguments) {
    CommandRequest request;
    request.command = command;
    request.arguments = arguments;
    return run(request);
}

nlohmann::ordered_json to_json(const CommandResult &result) {
    nlohmann::ordered_json output;
    output["cmd"] = result.command;
    if (result.arguments.has_value()) {
        output["args"] = *result.arguments;
    } else {
        output["args"] = nullptr;
    }
    output["status_code"] = result.exit_code;
    output["stdout"] = result.stdout_lines;
    output["stderr"] = result.stderr_lines;
    return output;
}

} // namespace command_runner
