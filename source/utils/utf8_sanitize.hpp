#ifndef CLEXEC_UTF8_SANITIZE_HPP
#define CLEXEC_UTF8_SANITIZE_HPP

#include <string>

namespace utf8_sanitize {

// Replaces every byte that does not start a well-formed UTF-8 sequence with U+FFFD.
// Overlong forms, surrogates and code points above U+10FFFF count as ill-formed,
// so the output is always accepted by nlohmann::json::dump().
void sanitize(std::string &text);

// Copying version of sanitize().
std::string sanitize(const std::string &text);

// True if the whole string is well-formed UTF-8.
bool is_valid(const std::string &text);

} // namespace utf8_sanitize

#endif // CLEXEC_UTF8_SANITIZE_HPP
