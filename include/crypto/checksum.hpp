#ifndef CHUNKVAULT_CRYPTO_CHECKSUM_HPP
#define CHUNKVAULT_CRYPTO_CHECKSUM_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "checksum_error.hpp"

namespace chunkvault::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-1 digest over one or more byte ranges
class Sha1Digest {
public:

  static constexpr size_t DIGEST_SIZE = 20;     // 160 bits
  static constexpr size_t HEX_SIZE = 2 * DIGEST_SIZE;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha1Digest();
  ~Sha1Digest();

  Sha1Digest(const Sha1Digest&) = delete;
  Sha1Digest& operator=(const Sha1Digest&) = delete;


  // ---- DIGEST OPERATIONS ----
  // Feeds exactly [data, data + size) into the digest
  void update(const std::uint8_t* data, std::size_t size);
  // Finalizes the digest and returns it as lowercase hex, further updates are rejected
  std::string final_hex();

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};


// ---- ONE-SHOT HELPERS ----
// SHA-1 hex digest of the logical range [data, data + size), nothing outside it
std::string compute_checksum(const std::uint8_t* data, std::size_t size);
std::string compute_checksum(const std::vector<std::uint8_t>& data);
std::string compute_checksum(const std::string& data);

} // namespace chunkvault::crypto

#endif // CHUNKVAULT_CRYPTO_CHECKSUM_HPP
