#include "mcp/mcp_stdio.hpp"

#include <fcntl.h>
#include <iostream>
#include <string>

namespace mcp_stdio {

bool MessageFramer::consume(char character, std::string &completed_message) {
    if (!started_) {
        if (character == '{') {
            started_ = true;
            brace_depth_ = 1;
            buffer_ += character;
        }
        return false;
    }

    buffer_ += character;

    if (escape_next_) {
        escape_next_ = false;
        return false;
    }

    if (character == '\\' && inside_string_) {
        escape_next_ = true;
        return false;
    }

    if (character == '"') {
        inside_string_ = !inside_string_;
        return false;
    }

    if (inside_string_) {
        return false;
    }

    if (character == '{') {
        brace_depth_++;
    } else if (character == '}') {
        brace_depth_--;
        if (brace_depth_ == 0) {
            completed_message = std::move(buffer_);
            buffer_.clear();
            started_ = false;
            return true;
        }
    }
    return false;
}

std::string read_message(std::istream &input) {
    MessageFramer framer;
    std::string message;
    char character;
    while (input.get(character)) {
        if (framer.consume(character, message)) {
            return message;
        }
    }

    // EOF reached without a complete message.
    return "";
}

int duplicate_descriptor(int descriptor) {
    return ::fcntl(descriptor, F_DUPFD_CLOEXEC, 0);
}

void write_message(const std::string &json_string) {
    std::cout << json_string << "\n";
    std::cout.flush();
}

void log_message(const std::string &message) {
    std::cerr << "[clexec] " << message << std::endl;
}

} // namespace mcp_stdio
