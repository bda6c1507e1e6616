#ifndef CHUNKVAULT_STORAGE_BYTE_SOURCE_HPP
#define CHUNKVAULT_STORAGE_BYTE_SOURCE_HPP

#include <istream>
#include <vector>
#include "backend/storage_backend.hpp"

namespace chunkvault {
namespace storage {

// Finite ordered sequence of byte fragments of arbitrary size
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Replaces fragment with the next piece of content; false once the source is exhausted
  virtual bool next(backend::Bytes& fragment) = 0;
};

// Reads an istream in fixed-size fragments
class IstreamByteSource : public ByteSource {
public:
  static constexpr std::size_t DEFAULT_FRAGMENT_SIZE = 4096;

  explicit IstreamByteSource(std::istream& input, std::size_t fragment_size = DEFAULT_FRAGMENT_SIZE);

  bool next(backend::Bytes& fragment) override;

private:
  std::istream& input_;
  std::size_t fragment_size_;
};

// Serves an in-memory buffer as fragments of a given size
class BufferByteSource : public ByteSource {
public:
  explicit BufferByteSource(backend::Bytes data, std::size_t fragment_size = IstreamByteSource::DEFAULT_FRAGMENT_SIZE);

  bool next(backend::Bytes& fragment) override;

private:
  backend::Bytes data_;
  std::size_t fragment_size_;
  std::size_t position_{0};
};

} // namespace storage
} // namespace chunkvault

#endif // CHUNKVAULT_STORAGE_BYTE_SOURCE_HPP
