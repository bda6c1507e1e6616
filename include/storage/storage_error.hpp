#ifndef CHUNKVAULT_STORAGE_STORAGE_ERROR_HPP
#define CHUNKVAULT_STORAGE_STORAGE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace chunkvault {
namespace storage {

class StorageError : public std::runtime_error {
public:
  explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

// Rejected before any backend write
class ValidationError : public StorageError {
public:
  explicit ValidationError(const std::string& message)
    : StorageError("Validation error: " + message) {}
};

// Memory threshold exceeded while draining an upload
class ResourcePressureError : public StorageError {
public:
  explicit ResourcePressureError(const std::string& message)
    : StorageError("Resource pressure: " + message) {}

  bool retryable() const { return true; }
};

class NotFoundError : public StorageError {
public:
  explicit NotFoundError(const std::string& message) : StorageError(message) {}
};

// Metadata names a chunk the backend does not have
class MissingChunkError : public NotFoundError {
public:
  MissingChunkError(const std::string& file_name, std::size_t index)
    : NotFoundError("Chunk " + std::to_string(index) + " of file " + file_name + " not found")
    , index_(index) {}

  std::size_t index() const { return index_; }

private:
  std::size_t index_;
};

class InvalidMetadataError : public StorageError {
public:
  explicit InvalidMetadataError(const std::string& message)
    : StorageError("Invalid metadata: " + message) {}
};

// Reassembled content does not match the stored size or checksum
class IntegrityError : public StorageError {
public:
  explicit IntegrityError(const std::string& message)
    : StorageError("Integrity error: " + message) {}
};

} // namespace storage
} // namespace chunkvault

#endif // CHUNKVAULT_STORAGE_STORAGE_ERROR_HPP
