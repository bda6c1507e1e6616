#ifndef CHUNKVAULT_APP_APP_CONFIG_HPP
#define CHUNKVAULT_APP_APP_CONFIG_HPP

#include <string>
#include "backend/redis_backend.hpp"
#include "http/http_server.hpp"
#include "logger/logger.hpp"
#include "storage/storage_config.hpp"

namespace chunkvault {
namespace app {

enum class BackendKind {
  MEMORY,
  REDIS
};

enum class RunMode {
  SERVE,
  SHELL
};

struct AppConfig {
  RunMode mode{RunMode::SERVE};
  BackendKind backend{BackendKind::MEMORY};
  backend::RedisConfig redis;
  storage::StorageConfig storage;
  http::HttpConfig http;
  logging::LogConfig logging;
};

// "memory" or "redis", throws std::invalid_argument otherwise
BackendKind parse_backend_kind(const std::string& name);
// "serve" or "shell", throws std::invalid_argument otherwise
RunMode parse_run_mode(const std::string& name);

// Rejects inconsistent settings with std::invalid_argument
void validate_config(const AppConfig& config);

} // namespace app
} // namespace chunkvault

#endif // CHUNKVAULT_APP_APP_CONFIG_HPP
