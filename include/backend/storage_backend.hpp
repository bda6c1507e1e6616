#ifndef CHUNKVAULT_BACKEND_STORAGE_BACKEND_HPP
#define CHUNKVAULT_BACKEND_STORAGE_BACKEND_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "backend/backend_error.hpp"

namespace chunkvault {
namespace backend {

using Bytes = std::vector<std::uint8_t>;

// Key/value capability consumed by the chunk orchestrator.
// Every call is independently durable once it returns; there is no ordering or
// atomicity across keys. Implementations must be safe to call from several
// threads at once. Failures are reported as BackendError.
class StorageBackend {
public:
  virtual ~StorageBackend() = default;

  // ---- SCALAR OPERATIONS ----
  // Returns the text value stored under key, nullopt when absent
  virtual std::optional<std::string> get(const std::string& key) = 0;
  // Returns the binary value stored under key, nullopt when absent
  virtual std::optional<Bytes> get_binary(const std::string& key) = 0;
  // Stores a text value, overwriting anything under key
  virtual void set(const std::string& key, const std::string& value) = 0;
  // Stores a binary value, overwriting anything under key
  virtual void set_binary(const std::string& key, const Bytes& value) = 0;


  // ---- LIST OPERATIONS ----
  // Appends value to the tail of the list stored under list_key
  virtual void append_to_list(const std::string& list_key, const std::string& value) = 0;
  // Returns the whole list in insertion order, empty when absent
  virtual std::vector<std::string> get_full_list(const std::string& list_key) = 0;


  // ---- QUERY OPERATIONS ----
  // Returns scalar keys matching a glob pattern ('*' and '?')
  virtual std::vector<std::string> list_keys(const std::string& pattern) = 0;

  // SHA-1 hex digest of the value stored under key, throws BackendError if absent
  std::string checksum_of(const std::string& key);
};

} // namespace backend
} // namespace chunkvault

#endif // CHUNKVAULT_BACKEND_STORAGE_BACKEND_HPP
