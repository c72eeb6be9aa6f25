#ifndef CLEXEC_DEBUG_LOG_HPP
#define CLEXEC_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if CLEXEC_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [clexec] prefix only when is_debug_enabled().
void log(const std::string &message);

// Same, with the emitting component named after the prefix: "[clexec] scope: message".
void log(const std::string &scope, const std::string &message);

} // namespace debug_log

#endif // CLEXEC_DEBUG_LOG_HPP
