#ifndef CHUNKVAULT_STORAGE_FILE_METADATA_HPP
#define CHUNKVAULT_STORAGE_FILE_METADATA_HPP

#include <cstdint>
#include <string>
#include <boost/date_time/posix_time/posix_time_types.hpp>

namespace chunkvault {
namespace storage {

// Per-file descriptor of chunk layout and integrity digest, stored under meta:{fileName}
struct FileMetadata {
  std::string file_name;
  std::uint64_t total_chunks{0};
  std::uint64_t chunk_size{0};
  std::uint64_t total_size{0};
  std::string checksum;
  boost::posix_time::ptime created_at;

  bool operator==(const FileMetadata& other) const {
    return file_name == other.file_name
      && total_chunks == other.total_chunks
      && chunk_size == other.chunk_size
      && total_size == other.total_size
      && checksum == other.checksum
      && created_at == other.created_at;
  }
  bool operator!=(const FileMetadata& other) const { return !(*this == other); }
};


// ---- SERIALIZATION ----
// One field=value entry per line, fixed field order
std::string serialize_metadata(const FileMetadata& metadata);
// Parses the serialized form, throws InvalidMetadataError on missing or malformed fields
FileMetadata parse_metadata(const std::string& text);


// ---- VALIDATION ----
// Checks the layout fields agree with each other, throws InvalidMetadataError
void validate_metadata(const FileMetadata& metadata);

} // namespace storage
} // namespace chunkvault

#endif // CHUNKVAULT_STORAGE_FILE_METADATA_HPP
