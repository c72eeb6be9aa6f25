#ifndef CLEXEC_ENV_FILE_HPP
#define CLEXEC_ENV_FILE_HPP

// dotenv-style environment loading.
// Lines are KEY=VALUE, optionally prefixed with "export ". Blank lines and lines
// starting with '#' are skipped. One pair of matching surrounding quotes is removed.

#include <string>
#include <utility>
#include <vector>

namespace env_file {

using EnvEntry = std::pair<std::string, std::string>;

// Parse file contents into entries, in file order. Malformed lines are skipped.
std::vector<EnvEntry> parse(const std::string &contents);

// Load the file at path into the process environment without overriding variables
// that are already set. Returns the number of variables applied, or -1 if the file
// could not be read.
int load(const std::string &path);

// Path of the env file to load: $CLEXEC_ENV_FILE if set, otherwise ".env".
std::string default_path();

} // namespace env_file

#endif // CLEXEC_ENV_FILE_HPP
