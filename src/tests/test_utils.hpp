#ifndef CHUNKVAULT_TEST_UTILS_HPP
#define CHUNKVAULT_TEST_UTILS_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "logger/logger.hpp"

namespace chunkvault::test {

// Console logging at warning level keeps test output readable
inline void init_test_logging(const std::string& level = "warning") {
  logging::LogConfig config;
  config.level = level;
  logging::init_logging(config);
}

inline std::vector<std::uint8_t> to_bytes(const std::string& text) {
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

// Deterministic non-repeating content so misplaced chunks change the result
inline std::vector<std::uint8_t> make_content(std::size_t size) {
  std::vector<std::uint8_t> content(size);
  for (std::size_t i = 0; i < size; ++i) {
    content[i] = static_cast<std::uint8_t>((i * 31 + i / 256) & 0xFF);
  }
  return content;
}

} // namespace chunkvault::test

#endif // CHUNKVAULT_TEST_UTILS_HPP
