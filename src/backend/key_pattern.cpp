#include "backend/key_pattern.hpp"

namespace chunkvault {
namespace backend {

bool matches_pattern(const std::string& pattern, const std::string& key) {
  std::size_t p = 0;
  std::size_t k = 0;
  // Position of the last '*' seen and the key position it was tried against
  std::size_t star = std::string::npos;
  std::size_t star_key = 0;

  while (k < key.size()) {
    if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      star_key = k;
      continue;
    }

    if (p < pattern.size()) {
      char expected = pattern[p];
      bool escaped = false;
      if (expected == '\\' && p + 1 < pattern.size()) {
        expected = pattern[p + 1];
        escaped = true;
      }
      if ((!escaped && expected == '?') || expected == key[k]) {
        p += escaped ? 2 : 1;
        ++k;
        continue;
      }
    }

    // Mismatch: let the last star swallow one more character
    if (star == std::string::npos) {
      return false;
    }
    p = star + 1;
    k = ++star_key;
  }

  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

std::string escape_pattern(const std::string& literal) {
  std::string escaped;
  escaped.reserve(literal.size());
  for (char c : literal) {
    if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return escaped;
}

} // namespace backend
} // namespace chunkvault
