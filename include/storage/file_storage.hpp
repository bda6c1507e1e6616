#ifndef CHUNKVAULT_STORAGE_FILE_STORAGE_HPP
#define CHUNKVAULT_STORAGE_FILE_STORAGE_HPP

#include <optional>
#include <string>
#include <vector>
#include "backend/storage_backend.hpp"
#include "storage/byte_source.hpp"
#include "storage/chunker.hpp"
#include "storage/file_metadata.hpp"
#include "storage/memory_probe.hpp"
#include "storage/storage_config.hpp"
#include "storage/storage_error.hpp"

namespace chunkvault {
namespace storage {

// Splits uploads into chunk records over a key/value backend and reassembles
// them on download, verified against the stored SHA-1 checksum.
class FileStorage {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  FileStorage(backend::StorageBackend& backend, const StorageConfig& config, MemoryProbe& probe);


  // ---- CORE STORAGE OPERATIONS ----
  // Drains source, writes its chunks in batches of `parallel`, then the metadata
  // record, then the file index entry. On a chunk write failure completed chunk
  // slots are blanked and the original error is rethrown.
  void upload_file(ByteSource& source, const std::string& file_name,
                   std::size_t chunk_size, int parallel = 1);
  // Fetches chunks in batches of `parallel` and returns the checksum-verified content
  backend::Bytes download_file(const std::string& file_name, int parallel = 1);


  // ---- QUERY OPERATIONS ----
  // Distinct names from the file index, in first-upload order
  std::vector<std::string> list_uploaded_files();
  // True when a metadata record exists for file_name
  bool exists(const std::string& file_name);
  // Parsed and validated metadata, throws NotFoundError when absent and
  // InvalidMetadataError when the record is inconsistent or exceeds max_chunk_size
  FileMetadata get_metadata(const std::string& file_name);


  // ---- GETTERS ----
  const StorageConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  backend::StorageBackend& backend_;
  StorageConfig config_;
  MemoryProbe& probe_;


  // ---- UPLOAD SUPPORT ----
  void validate_upload(const std::string& file_name, std::size_t chunk_size) const;
  // Writes every planned chunk; on failure blanks completed slots and rethrows
  void write_chunks(const std::string& file_name, const backend::Bytes& buffer,
                    const std::vector<ChunkSpan>& spans, std::size_t parallel);
  // Best-effort overwrite of chunk slots with empty payloads, errors only logged
  void blank_chunks(const std::string& file_name, const std::vector<std::size_t>& indices);
  // Blanks existing chunk slots with index in [first, end)
  void blank_stale_chunks(const std::string& file_name, std::uint64_t first, std::uint64_t end);
  // Metadata of a previous upload under the same name, if readable and consistent
  std::optional<FileMetadata> previous_metadata(const std::string& file_name);


  // ---- DOWNLOAD SUPPORT ----
  // Fetches chunks [0, total_chunks) in batches, appending them to output in index order
  void fetch_chunks(const FileMetadata& metadata, std::size_t parallel, backend::Bytes& output);
  // Throws IntegrityError if content does not match the recorded size and checksum
  void verify_content(const FileMetadata& metadata, const backend::Bytes& content) const;
};

} // namespace storage
} // namespace chunkvault

#endif // CHUNKVAULT_STORAGE_FILE_STORAGE_HPP
