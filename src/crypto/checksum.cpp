#include "crypto/checksum.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace chunkvault::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw ChecksumError("Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sha1Digest::Sha1Digest() : context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha1(), nullptr)) {
    throw ChecksumError("Failed to initialize SHA-1 digest");
  }
}

Sha1Digest::~Sha1Digest() = default;


//==============================================
// DIGEST OPERATIONS
//==============================================

void Sha1Digest::update(const std::uint8_t* data, std::size_t size) {
  if (finalized_) {
    throw ChecksumError("Digest already finalized");
  }

  // An empty range contributes nothing and may come with a null pointer
  if (size == 0) {
    return;
  }

  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    throw ChecksumError("Failed to update digest");
  }
}

std::string Sha1Digest::final_hex() {
  if (finalized_) {
    throw ChecksumError("Digest already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw ChecksumError("Failed to finalize digest");
  }
  finalized_ = true;

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}


//==============================================
// ONE-SHOT HELPERS
//==============================================

std::string compute_checksum(const std::uint8_t* data, std::size_t size) {
  Sha1Digest digest;
  digest.update(data, size);
  std::string result = digest.final_hex();
  BOOST_LOG_TRIVIAL(trace) << "Checksum: " << size << " bytes -> " << result;
  return result;
}

std::string compute_checksum(const std::vector<std::uint8_t>& data) {
  return compute_checksum(data.data(), data.size());
}

std::string compute_checksum(const std::string& data) {
  return compute_checksum(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

} // namespace chunkvault::crypto
