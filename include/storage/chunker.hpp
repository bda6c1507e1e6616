#ifndef CHUNKVAULT_STORAGE_CHUNKER_HPP
#define CHUNKVAULT_STORAGE_CHUNKER_HPP

#include <cstdint>
#include <vector>
#include "backend/storage_backend.hpp"

namespace chunkvault {
namespace storage {

// Contiguous byte range of a buffer that becomes one chunk record
struct ChunkSpan {
  std::size_t index;
  std::size_t offset;
  std::size_t length;
};

// ceil(total_size / chunk_size), zero for empty content; chunk_size must be positive
std::uint64_t chunk_count(std::uint64_t total_size, std::uint64_t chunk_size);

// Splits [0, total_size) into ordered non-overlapping spans of chunk_size bytes,
// the last one shorter when total_size is not a multiple
std::vector<ChunkSpan> plan_chunks(std::size_t total_size, std::size_t chunk_size);

// Copies the bytes of one span out of the full buffer
backend::Bytes slice_chunk(const backend::Bytes& buffer, const ChunkSpan& span);

} // namespace storage
} // namespace chunkvault

#endif // CHUNKVAULT_STORAGE_CHUNKER_HPP
