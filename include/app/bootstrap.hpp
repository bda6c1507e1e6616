#pragma once

#include <memory>
#include "app/app_config.hpp"
#include "backend/storage_backend.hpp"
#include "http/http_server.hpp"
#include "storage/file_storage.hpp"
#include "storage/memory_probe.hpp"

namespace chunkvault {
namespace app {

// Builds the backend selected by config, throws BackendError if it cannot be reached
std::unique_ptr<backend::StorageBackend> make_backend(const AppConfig& config);

class Bootstrap {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Bootstrap(const AppConfig& config);
  // Uses the given backend and probe instead of building them from config
  Bootstrap(const AppConfig& config, std::unique_ptr<backend::StorageBackend> backend,
            std::unique_ptr<storage::MemoryProbe> probe);
  ~Bootstrap();

  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  // Starts the HTTP listener
  bool start();
  // Terminates all components in reverse dependency order
  bool shutdown();


  // ---- GETTERS AND SETTERS ----
  backend::StorageBackend& get_backend() { return *backend_; }
  storage::FileStorage& get_file_storage() { return *file_storage_; }
  http::HttpServer& get_http_server() { return *http_server_; }
  const AppConfig& get_config() const { return config_; }

private:
  // ---- PARAMETERS ----
  AppConfig config_;

  // System components
  std::unique_ptr<backend::StorageBackend> backend_;
  std::unique_ptr<storage::MemoryProbe> probe_;
  std::unique_ptr<storage::FileStorage> file_storage_;
  std::unique_ptr<http::HttpServer> http_server_;

  void create_components();
};

} // namespace app
} // namespace chunkvault
