#ifndef CHUNKVAULT_CRYPTO_CHECKSUM_ERROR_HPP
#define CHUNKVAULT_CRYPTO_CHECKSUM_ERROR_HPP

#include <stdexcept>
#include <string>

namespace chunkvault::crypto {

class ChecksumError : public std::runtime_error {
public:
    explicit ChecksumError(const std::string& message) 
        : std::runtime_error("Checksum error: " + message) {}
};

} // namespace chunkvault::crypto

#endif // CHUNKVAULT_CRYPTO_CHECKSUM_ERROR_HPP
