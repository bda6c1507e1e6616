#include "storage/chunker.hpp"
#include <algorithm>
#include <stdexcept>

namespace chunkvault {
namespace storage {

std::uint64_t chunk_count(std::uint64_t total_size, std::uint64_t chunk_size) {
  if (chunk_size == 0) {
    throw std::invalid_argument("Chunker: chunk size must be positive");
  }
  return total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
}

std::vector<ChunkSpan> plan_chunks(std::size_t total_size, std::size_t chunk_size) {
  std::vector<ChunkSpan> spans;
  spans.reserve(static_cast<std::size_t>(chunk_count(total_size, chunk_size)));

  for (std::size_t offset = 0, index = 0; offset < total_size; offset += chunk_size, ++index) {
    spans.push_back({index, offset, std::min(chunk_size, total_size - offset)});
  }
  return spans;
}

backend::Bytes slice_chunk(const backend::Bytes& buffer, const ChunkSpan& span) {
  if (span.offset + span.length > buffer.size()) {
    throw std::out_of_range("Chunker: span exceeds buffer");
  }
  auto first = buffer.begin() + static_cast<std::ptrdiff_t>(span.offset);
  return backend::Bytes(first, first + static_cast<std::ptrdiff_t>(span.length));
}

} // namespace storage
} // namespace chunkvault
