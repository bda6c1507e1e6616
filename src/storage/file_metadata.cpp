#include "storage/file_metadata.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/trivial.hpp>
#include "storage/chunker.hpp"
#include "storage/storage_error.hpp"

namespace chunkvault {
namespace storage {

namespace {

constexpr const char* FIELD_FILE_NAME = "fileName";
constexpr const char* FIELD_TOTAL_CHUNKS = "totalChunks";
constexpr const char* FIELD_CHUNK_SIZE = "chunkSize";
constexpr const char* FIELD_TOTAL_SIZE = "totalSize";
constexpr const char* FIELD_CHECKSUM = "checksum";
constexpr const char* FIELD_CREATED_AT = "createdAt";

constexpr std::size_t CHECKSUM_HEX_LENGTH = 40;

const std::string& require_field(const std::map<std::string, std::string>& fields, const char* name) {
  auto it = fields.find(name);
  if (it == fields.end()) {
    throw InvalidMetadataError(std::string("missing field ") + name);
  }
  return it->second;
}

std::uint64_t parse_unsigned(const std::string& value, const char* name) {
  if (value.empty() || !std::all_of(value.begin(), value.end(),
                                    [](unsigned char c) { return std::isdigit(c); })) {
    throw InvalidMetadataError(std::string("field ") + name + " is not a non-negative integer: '" + value + "'");
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw InvalidMetadataError(std::string("field ") + name + " is out of range: " + value);
  }
}

boost::posix_time::ptime parse_timestamp(std::string value) {
  if (!value.empty() && value.back() == 'Z') {
    value.pop_back();
  }
  try {
    auto parsed = boost::posix_time::from_iso_extended_string(value);
    if (parsed.is_special()) {
      throw InvalidMetadataError("field createdAt is not a valid timestamp: " + value);
    }
    return parsed;
  } catch (const InvalidMetadataError&) {
    throw;
  } catch (const std::exception& e) {
    throw InvalidMetadataError("field createdAt is not a valid timestamp: " + value + " (" + e.what() + ")");
  }
}

} // namespace


//==============================================
// SERIALIZATION
//==============================================

std::string serialize_metadata(const FileMetadata& metadata) {
  std::ostringstream out;
  out << FIELD_FILE_NAME << '=' << metadata.file_name << '\n'
      << FIELD_TOTAL_CHUNKS << '=' << metadata.total_chunks << '\n'
      << FIELD_CHUNK_SIZE << '=' << metadata.chunk_size << '\n'
      << FIELD_TOTAL_SIZE << '=' << metadata.total_size << '\n'
      << FIELD_CHECKSUM << '=' << metadata.checksum << '\n'
      << FIELD_CREATED_AT << '=' << boost::posix_time::to_iso_extended_string(metadata.created_at) << "Z\n";
  return out.str();
}

FileMetadata parse_metadata(const std::string& text) {
  std::map<std::string, std::string> fields;
  std::istringstream in(text);
  std::string line;

  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }

    auto separator = line.find('=');
    if (separator == std::string::npos) {
      throw InvalidMetadataError("malformed line: " + line);
    }
    fields[line.substr(0, separator)] = line.substr(separator + 1);
  }

  FileMetadata metadata;
  metadata.file_name = require_field(fields, FIELD_FILE_NAME);
  metadata.total_chunks = parse_unsigned(require_field(fields, FIELD_TOTAL_CHUNKS), FIELD_TOTAL_CHUNKS);
  metadata.chunk_size = parse_unsigned(require_field(fields, FIELD_CHUNK_SIZE), FIELD_CHUNK_SIZE);
  metadata.total_size = parse_unsigned(require_field(fields, FIELD_TOTAL_SIZE), FIELD_TOTAL_SIZE);
  metadata.checksum = require_field(fields, FIELD_CHECKSUM);
  metadata.created_at = parse_timestamp(require_field(fields, FIELD_CREATED_AT));

  BOOST_LOG_TRIVIAL(trace) << "File metadata: Parsed record for " << metadata.file_name;
  return metadata;
}


//==============================================
// VALIDATION
//==============================================

void validate_metadata(const FileMetadata& metadata) {
  if (metadata.file_name.empty()) {
    throw InvalidMetadataError("empty file name");
  }

  if (metadata.chunk_size == 0) {
    throw InvalidMetadataError("chunk size must be positive for " + metadata.file_name);
  }

  // Zero chunks is only a valid layout for empty content
  if (metadata.total_chunks == 0 && metadata.total_size != 0) {
    throw InvalidMetadataError("zero chunks recorded for " + std::to_string(metadata.total_size) +
                               " bytes of " + metadata.file_name);
  }

  const auto expected_chunks = chunk_count(metadata.total_size, metadata.chunk_size);
  if (metadata.total_chunks != expected_chunks) {
    throw InvalidMetadataError("chunk count " + std::to_string(metadata.total_chunks) +
                               " does not match size " + std::to_string(metadata.total_size) +
                               " / chunk size " + std::to_string(metadata.chunk_size) +
                               " for " + metadata.file_name);
  }

  // Lowercase only, the form compute_checksum produces
  const bool hex = std::all_of(metadata.checksum.begin(), metadata.checksum.end(),
                               [](unsigned char c) { return std::isdigit(c) || (c >= 'a' && c <= 'f'); });
  if (metadata.checksum.size() != CHECKSUM_HEX_LENGTH || !hex) {
    throw InvalidMetadataError("malformed checksum for " + metadata.file_name);
  }
}

} // namespace storage
} // namespace chunkvault
