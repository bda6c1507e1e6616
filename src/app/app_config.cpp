#include "app/app_config.hpp"
#include <stdexcept>

namespace chunkvault {
namespace app {

BackendKind parse_backend_kind(const std::string& name) {
  if (name == "memory") {
    return BackendKind::MEMORY;
  }
  if (name == "redis") {
    return BackendKind::REDIS;
  }
  throw std::invalid_argument("Unknown backend: " + name + " (expected memory or redis)");
}

RunMode parse_run_mode(const std::string& name) {
  if (name == "serve") {
    return RunMode::SERVE;
  }
  if (name == "shell") {
    return RunMode::SHELL;
  }
  throw std::invalid_argument("Unknown mode: " + name + " (expected serve or shell)");
}

void validate_config(const AppConfig& config) {
  if (config.storage.max_chunk_size == 0) {
    throw std::invalid_argument("Maximum chunk size must be positive");
  }
  if (config.http.upload_chunk_size == 0 || config.http.upload_chunk_size > config.storage.max_chunk_size) {
    throw std::invalid_argument("Chunk size must be between 1 and " +
                                std::to_string(config.storage.max_chunk_size));
  }
  if (!(config.storage.memory_pressure_threshold > 0.0)) {
    throw std::invalid_argument("Memory threshold must be positive");
  }
  if (config.backend == BackendKind::REDIS && config.redis.pool_size == 0) {
    throw std::invalid_argument("Redis pool size must be positive");
  }
  // Throws for unknown level names
  logging::parse_severity(config.logging.level);
}

} // namespace app
} // namespace chunkvault
