#include "backend/storage_backend.hpp"
#include <boost/log/trivial.hpp>
#include "crypto/checksum.hpp"

namespace chunkvault {
namespace backend {

std::string StorageBackend::checksum_of(const std::string& key) {
  if (auto binary = get_binary(key)) {
    return crypto::compute_checksum(*binary);
  }
  if (auto text = get(key)) {
    return crypto::compute_checksum(*text);
  }

  BOOST_LOG_TRIVIAL(error) << "Storage backend: Key not found for checksum: " << key;
  throw BackendError("Storage backend: Key not found: " + key);
}

} // namespace backend
} // namespace chunkvault
