#include "utils/env_file.hpp"
#include "utils/debug_log.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdlib.h>

namespace env_file {

static const char WHITESPACE[] = " \t\r";

static std::string trim(const std::string &text) {
    size_t first = text.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}

static std::string unquote(const std::string &value) {
    if (value.size() >= 2) {
        char first = value.front();
        char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

static bool is_valid_key(const std::string &key) {
    if (key.empty()) {
        return false;
    }
    for (char character : key) {
        bool allowed = (character >= 'A' && character <= 'Z') || (character >= 'a' && character <= 'z') ||
                       (character >= '0' && character <= '9') || character == '_';
        if (!allowed) {
            return false;
        }
    }
    return !(key[0] >= '0' && key[0] <= '9');
}

std::vector<EnvEntry> parse(const std::string &contents) {
    std::vector<EnvEntry> entries;
    std::istringstream line_stream(contents);
    std::string raw_line;

    while (std::getline(line_stream, raw_line)) {
        std::string line = trim(raw_line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }

        size_t separator = line.find('=');
        if (separator == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, separator));
        if (!is_valid_key(key)) {
            continue;
        }
        entries.emplace_back(key, unquote(trim(line.substr(separator + 1))));
    }

    return entries;
}

int load(const std::string &path) {
    std::ifstream file_stream(path);
    if (!file_stream.is_open()) {
        return -1;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();

    int applied = 0;
    for (const auto &entry : parse(string_stream.str())) {
        if (std::getenv(entry.first.c_str()) != nullptr) {
            continue;
        }
        if (setenv(entry.first.c_str(), entry.second.c_str(), 0) == 0) {
            applied++;
        }
    }

    debug_log::log("env_file", "applied " + std::to_string(applied) + " variable(s) from " + path);
    return applied;
}

std::string default_path() {
    const char *configured = std::getenv("CLEXEC_ENV_FILE");
    if (configured != nullptr && configured[0] != '\0') {
        return configured;
    }
    return ".env";
}

} // namespace env_file
