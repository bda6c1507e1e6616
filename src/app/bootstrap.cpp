#include "app/bootstrap.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "backend/memory_backend.hpp"
#include "backend/redis_backend.hpp"

namespace chunkvault {
namespace app {

std::unique_ptr<backend::StorageBackend> make_backend(const AppConfig& config) {
  switch (config.backend) {
    case BackendKind::MEMORY:
      return std::make_unique<backend::MemoryBackend>();

    case BackendKind::REDIS:
#ifdef CHUNKVAULT_WITH_REDIS
      return std::make_unique<backend::RedisBackend>(config.redis);
#else
      throw std::invalid_argument("Bootstrap program: Redis backend requested but this build has no hiredis");
#endif
  }
  throw std::invalid_argument("Bootstrap program: Unknown backend kind");
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Bootstrap::Bootstrap(const AppConfig& config)
  : Bootstrap(config, make_backend(config), std::make_unique<storage::ProcessMemoryProbe>()) {}

Bootstrap::Bootstrap(const AppConfig& config, std::unique_ptr<backend::StorageBackend> backend,
                     std::unique_ptr<storage::MemoryProbe> probe)
  : config_(config)
  , backend_(std::move(backend))
  , probe_(std::move(probe)) {

  BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Initializing components";

  if (!backend_ || !probe_) {
    throw std::invalid_argument("Bootstrap program: Backend and memory probe are required");
  }

  try {
    create_components();
    BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Successfully created all components";
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to initialize components: " << e.what();
    throw;
  }
}

Bootstrap::~Bootstrap() {
  try {
    if (!this->shutdown()) {
      BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to shutdown cleanly in destructor";
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Error during destructor shutdown: " << e.what();
  }
}

void Bootstrap::create_components() {
  // Storage depends on the backend and probe passed in explicitly
  file_storage_ = std::make_unique<storage::FileStorage>(*backend_, config_.storage, *probe_);
  BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: File storage created successfully";

  // HTTP server last as it depends on the storage
  http_server_ = std::make_unique<http::HttpServer>(*file_storage_, config_.http);
  BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: HTTP server created successfully";
}


//==============================================
// INITIALIZATION AND DESTRUCTION METHODS
//==============================================

bool Bootstrap::start() {
  if (!http_server_) {
    BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Cannot start after shutdown";
    return false;
  }
  if (!http_server_->start()) {
    BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Failed to start HTTP server";
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Bootstrap successfully started";
  return true;
}

bool Bootstrap::shutdown() {
  try {
    BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Initiating shutdown sequence";

    // First the HTTP server as it depends on the storage
    if (http_server_) {
      BOOST_LOG_TRIVIAL(debug) << "Bootstrap program: Shutting down HTTP server";
      http_server_->shutdown();
      http_server_.reset();
    }

    if (file_storage_) {
      file_storage_.reset();
    }

    // Backend and probe last as they have no dependencies
    backend_.reset();
    probe_.reset();

    BOOST_LOG_TRIVIAL(info) << "Bootstrap program: Shutdown complete";
    return true;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Bootstrap program: Error during shutdown: " << e.what();
    return false;
  }
}

} // namespace app
} // namespace chunkvault
