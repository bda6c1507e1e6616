#ifndef CHUNKVAULT_BACKEND_MEMORY_BACKEND_HPP
#define CHUNKVAULT_BACKEND_MEMORY_BACKEND_HPP

#include <map>
#include <mutex>
#include <string>
#include <variant>
#include <vector>
#include "backend/storage_backend.hpp"

namespace chunkvault {
namespace backend {

// In-process backend. Text and binary values share one keyspace but keep their
// stored type: get() only sees text, get_binary() only sees binary.
class MemoryBackend : public StorageBackend {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  MemoryBackend();
  ~MemoryBackend() override = default;


  // ---- SCALAR OPERATIONS ----
  std::optional<std::string> get(const std::string& key) override;
  std::optional<Bytes> get_binary(const std::string& key) override;
  void set(const std::string& key, const std::string& value) override;
  void set_binary(const std::string& key, const Bytes& value) override;


  // ---- LIST OPERATIONS ----
  void append_to_list(const std::string& list_key, const std::string& value) override;
  std::vector<std::string> get_full_list(const std::string& list_key) override;


  // ---- QUERY OPERATIONS ----
  std::vector<std::string> list_keys(const std::string& pattern) override;
  // Number of scalar keys currently stored
  std::size_t size() const;
  // Removes every scalar and list
  void clear();

private:
  // ---- PARAMETERS ----
  using StoredValue = std::variant<std::string, Bytes>;

  mutable std::mutex mutex_;
  std::map<std::string, StoredValue> values_;
  std::map<std::string, std::vector<std::string>> lists_;
};

} // namespace backend
} // namespace chunkvault

#endif // CHUNKVAULT_BACKEND_MEMORY_BACKEND_HPP
