#include "storage/file_storage.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/trivial.hpp>
#include "backend/key_pattern.hpp"
#include "crypto/checksum.hpp"
#include "storage/buffer_drain.hpp"
#include "storage/key_layout.hpp"
#include "utils/batch_runner.hpp"

namespace chunkvault {
namespace storage {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileStorage::FileStorage(backend::StorageBackend& backend, const StorageConfig& config, MemoryProbe& probe)
  : backend_(backend)
  , config_(config)
  , probe_(probe) {
  BOOST_LOG_TRIVIAL(info) << "File storage: Initializing with max chunk size " << config_.max_chunk_size
                          << " bytes, memory threshold " << config_.memory_pressure_threshold;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void FileStorage::upload_file(ByteSource& source, const std::string& file_name,
                              std::size_t chunk_size, int parallel) {
  BOOST_LOG_TRIVIAL(info) << "File storage: Uploading file: " << file_name << " with chunk size "
                          << chunk_size << ", parallel " << parallel;

  validate_upload(file_name, chunk_size);
  const std::size_t parallelism = utils::effective_parallelism(parallel);

  backend::Bytes buffer = drain_source(source, probe_, config_);
  const std::string checksum = crypto::compute_checksum(buffer);
  const auto spans = plan_chunks(buffer.size(), chunk_size);
  BOOST_LOG_TRIVIAL(debug) << "File storage: " << file_name << " is " << buffer.size() << " bytes in "
                           << spans.size() << " chunks, checksum " << checksum;

  auto previous = previous_metadata(file_name);

  write_chunks(file_name, buffer, spans, parallelism);

  FileMetadata metadata;
  metadata.file_name = file_name;
  metadata.total_chunks = spans.size();
  metadata.chunk_size = chunk_size;
  metadata.total_size = buffer.size();
  metadata.checksum = checksum;
  metadata.created_at = boost::posix_time::microsec_clock::universal_time();

  try {
    backend_.set(meta_key(file_name), serialize_metadata(metadata));
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "File storage: Failed to write metadata for " << file_name << ": " << e.what();
    std::vector<std::size_t> all_chunks(spans.size());
    for (std::size_t i = 0; i < spans.size(); ++i) {
      all_chunks[i] = i;
    }
    blank_chunks(file_name, all_chunks);
    throw;
  }

  // Slots left over from a longer previous upload under this name
  if (previous && previous->total_chunks > metadata.total_chunks) {
    blank_stale_chunks(file_name, metadata.total_chunks, previous->total_chunks);
  }

  backend_.append_to_list(FILE_INDEX_KEY, file_name);

  BOOST_LOG_TRIVIAL(info) << "File storage: Successfully uploaded " << buffer.size() << " bytes as "
                          << spans.size() << " chunks for file: " << file_name;
}

backend::Bytes FileStorage::download_file(const std::string& file_name, int parallel) {
  BOOST_LOG_TRIVIAL(info) << "File storage: Downloading file: " << file_name << ", parallel " << parallel;

  const FileMetadata metadata = get_metadata(file_name);
  const std::size_t parallelism = utils::effective_parallelism(parallel);

  backend::Bytes content;
  fetch_chunks(metadata, parallelism, content);
  verify_content(metadata, content);

  BOOST_LOG_TRIVIAL(info) << "File storage: Successfully downloaded " << content.size()
                          << " bytes for file: " << file_name;
  return content;
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<std::string> FileStorage::list_uploaded_files() {
  std::vector<std::string> names;
  std::unordered_set<std::string> seen;

  for (auto& name : backend_.get_full_list(FILE_INDEX_KEY)) {
    if (seen.insert(name).second) {
      names.push_back(std::move(name));
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "File storage: Listed " << names.size() << " uploaded files";
  return names;
}

bool FileStorage::exists(const std::string& file_name) {
  return backend_.get(meta_key(file_name)).has_value();
}

FileMetadata FileStorage::get_metadata(const std::string& file_name) {
  auto text = backend_.get(meta_key(file_name));
  if (!text) {
    BOOST_LOG_TRIVIAL(info) << "File storage: No metadata for file: " << file_name;
    throw NotFoundError("File " + file_name + " not found");
  }

  FileMetadata metadata = parse_metadata(*text);
  validate_metadata(metadata);

  if (metadata.chunk_size > config_.max_chunk_size) {
    BOOST_LOG_TRIVIAL(error) << "File storage: Metadata for " << file_name << " records chunk size "
                             << metadata.chunk_size << " above maximum " << config_.max_chunk_size;
    throw InvalidMetadataError("chunk size " + std::to_string(metadata.chunk_size) + " of " + file_name +
                               " exceeds maximum " + std::to_string(config_.max_chunk_size));
  }

  if (metadata.file_name != file_name) {
    BOOST_LOG_TRIVIAL(error) << "File storage: Metadata under " << meta_key(file_name)
                             << " names a different file: " << metadata.file_name;
    throw InvalidMetadataError("record for " + file_name + " names " + metadata.file_name);
  }
  return metadata;
}


//==============================================
// UPLOAD SUPPORT
//==============================================

void FileStorage::validate_upload(const std::string& file_name, std::size_t chunk_size) const {
  if (file_name.empty()) {
    throw ValidationError("file name must not be empty");
  }
  if (file_name.find_first_of("\r\n") != std::string::npos) {
    throw ValidationError("file name must not contain line breaks");
  }
  if (chunk_size == 0) {
    throw ValidationError("chunk size must be positive");
  }
  if (chunk_size > config_.max_chunk_size) {
    BOOST_LOG_TRIVIAL(error) << "File storage: Chunk size " << chunk_size << " exceeds maximum "
                             << config_.max_chunk_size;
    throw ValidationError("chunk size " + std::to_string(chunk_size) + " exceeds maximum " +
                          std::to_string(config_.max_chunk_size));
  }
}

void FileStorage::write_chunks(const std::string& file_name, const backend::Bytes& buffer,
                               const std::vector<ChunkSpan>& spans, std::size_t parallel) {
  std::vector<std::size_t> written;

  for (std::size_t batch_start = 0; batch_start < spans.size(); batch_start += parallel) {
    const std::size_t batch_end = std::min(batch_start + parallel, spans.size());
    BOOST_LOG_TRIVIAL(trace) << "File storage: Writing chunks [" << batch_start << ", " << batch_end
                             << ") of " << file_name;

    std::vector<utils::BatchResult<std::size_t>> results;
    try {
      results = utils::run_batch<std::size_t>(batch_start, batch_end, [&](std::size_t index) {
        backend_.set_binary(chunk_key(file_name, index), slice_chunk(buffer, spans[index]));
        return spans[index].length;
      });
    } catch (const std::exception& e) {
      // Outcomes of this batch are unknown, so every slot it may have touched goes
      BOOST_LOG_TRIVIAL(error) << "File storage: Chunk batch for " << file_name << " aborted: " << e.what();
      for (auto index = batch_start; index < batch_end; ++index) {
        written.push_back(index);
      }
      blank_chunks(file_name, written);
      throw;
    }

    bool failed = false;
    for (const auto& result : results) {
      if (result.ok()) {
        written.push_back(result.index);
      } else {
        failed = true;
      }
    }

    if (failed) {
      BOOST_LOG_TRIVIAL(error) << "File storage: Chunk write failed for " << file_name
                               << ", cleaning up " << written.size() << " written chunks";
      std::sort(written.begin(), written.end());
      blank_chunks(file_name, written);
      utils::rethrow_first_error(results);
    }
  }
}

void FileStorage::blank_chunks(const std::string& file_name, const std::vector<std::size_t>& indices) {
  const backend::Bytes empty;
  for (auto index : indices) {
    try {
      backend_.set_binary(chunk_key(file_name, index), empty);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(warning) << "File storage: Failed to blank chunk " << index << " of "
                                 << file_name << ": " << e.what();
    }
  }
}

std::optional<FileMetadata> FileStorage::previous_metadata(const std::string& file_name) {
  auto text = backend_.get(meta_key(file_name));
  if (!text) {
    return std::nullopt;
  }
  try {
    auto metadata = parse_metadata(*text);
    validate_metadata(metadata);
    return metadata;
  } catch (const InvalidMetadataError& e) {
    BOOST_LOG_TRIVIAL(warning) << "File storage: Ignoring unreadable previous metadata for "
                               << file_name << ": " << e.what();
    return std::nullopt;
  }
}


void FileStorage::blank_stale_chunks(const std::string& file_name, std::uint64_t first, std::uint64_t end) {
  // Only slots that actually exist, so a damaged record cannot inflate the range
  const std::string prefix = chunk_key(file_name, 0).substr(0, chunk_key(file_name, 0).size() - 1);
  std::vector<std::size_t> stale;

  for (const auto& key : backend_.list_keys(backend::escape_pattern(prefix) + "*")) {
    const std::string suffix = key.substr(prefix.size());
    if (suffix.empty() || suffix.size() > 19 ||
        !std::all_of(suffix.begin(), suffix.end(), [](unsigned char c) { return std::isdigit(c); })) {
      continue;
    }
    const auto index = std::stoull(suffix);
    if (index >= first && index < end) {
      stale.push_back(static_cast<std::size_t>(index));
    }
  }

  std::sort(stale.begin(), stale.end());
  BOOST_LOG_TRIVIAL(debug) << "File storage: Blanking " << stale.size() << " stale chunks of " << file_name;
  blank_chunks(file_name, stale);
}


//==============================================
// DOWNLOAD SUPPORT
//==============================================

void FileStorage::fetch_chunks(const FileMetadata& metadata, std::size_t parallel, backend::Bytes& output) {
  const auto total_chunks = static_cast<std::size_t>(metadata.total_chunks);

  for (std::size_t batch_start = 0; batch_start < total_chunks; batch_start += parallel) {
    const std::size_t batch_end = std::min(batch_start + parallel, total_chunks);
    BOOST_LOG_TRIVIAL(trace) << "File storage: Fetching chunks [" << batch_start << ", " << batch_end
                             << ") of " << metadata.file_name;

    auto results = utils::run_batch<backend::Bytes>(batch_start, batch_end, [&](std::size_t index) {
      auto chunk = backend_.get_binary(chunk_key(metadata.file_name, index));
      if (!chunk) {
        BOOST_LOG_TRIVIAL(error) << "File storage: Missing chunk " << index << " of " << metadata.file_name;
        throw MissingChunkError(metadata.file_name, index);
      }
      return std::move(*chunk);
    });

    utils::rethrow_first_error(results);

    // Completion order is not issue order
    utils::sort_by_index(results);
    for (const auto& result : results) {
      output.insert(output.end(), result.value->begin(), result.value->end());
    }
  }
}

void FileStorage::verify_content(const FileMetadata& metadata, const backend::Bytes& content) const {
  if (content.size() != metadata.total_size) {
    BOOST_LOG_TRIVIAL(error) << "File storage: Size mismatch for " << metadata.file_name << ": expected "
                             << metadata.total_size << ", got " << content.size();
    throw IntegrityError("size mismatch for " + metadata.file_name + ": expected " +
                         std::to_string(metadata.total_size) + " bytes, got " + std::to_string(content.size()));
  }

  const std::string actual = crypto::compute_checksum(content);
  if (actual != metadata.checksum) {
    BOOST_LOG_TRIVIAL(error) << "File storage: Checksum mismatch for " << metadata.file_name << ": expected "
                             << metadata.checksum << ", got " << actual;
    throw IntegrityError("checksum mismatch for " + metadata.file_name);
  }
}

} // namespace storage
} // namespace chunkvault
