#ifndef CLEXEC_MCP_STDIO_HPP
#define CLEXEC_MCP_STDIO_HPP

// MCP stdio transport: framing JSON messages read from stdin, writing responses
// to stdout, logging to stderr.

#include <iosfwd>
#include <string>

namespace mcp_stdio {

// Incremental framer for a stream of JSON objects.
// Uses brace-counting with string/escape awareness, so it works both with
// newline-delimited and streamed JSON. Anything before an opening '{' is ignored.
class MessageFramer {
public:
    // Feed one character. Returns true when it completes a message, which is then
    // moved into completed_message.
    bool consume(char character, std::string &completed_message);

    // True while a message has been started but not yet completed.
    bool in_progress() const { return started_; }

private:
    std::string buffer_;
    int brace_depth_ = 0;
    bool inside_string_ = false;
    bool escape_next_ = false;
    bool started_ = false;
};

// Read a single complete JSON object from the stream.
// Returns the raw JSON string, or empty string on EOF.
std::string read_message(std::istream &input);

// Duplicate a descriptor with close-on-exec set, so spawned commands never
// inherit it. Returns -1 on failure with errno set.
int duplicate_descriptor(int descriptor);

// Write a JSON message to stdout, followed by a newline.
void write_message(const std::string &json_string);

// Write a log message to stderr (MCP allows this for logging).
void log_message(const std::string &message);

} // namespace mcp_stdio

#endif // CLEXEC_MCP_STDIO_HPP
