#ifndef CHUNKVAULT_BACKEND_KEY_PATTERN_HPP
#define CHUNKVAULT_BACKEND_KEY_PATTERN_HPP

#include <string>

namespace chunkvault {
namespace backend {

// Glob match in the style of Redis KEYS: '*' matches any run of characters,
// '?' matches exactly one, '\' escapes the next character. Everything else is literal.
bool matches_pattern(const std::string& pattern, const std::string& key);

// Escapes glob metacharacters so literal matches literally inside a pattern
std::string escape_pattern(const std::string& literal);

} // namespace backend
} // namespace chunkvault

#endif // CHUNKVAULT_BACKEND_KEY_PATTERN_HPP
