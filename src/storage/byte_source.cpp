#include "storage/byte_source.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include "storage/storage_error.hpp"

namespace chunkvault {
namespace storage {

//==============================================
// ISTREAM SOURCE
//==============================================

IstreamByteSource::IstreamByteSource(std::istream& input, std::size_t fragment_size)
  : input_(input)
  , fragment_size_(fragment_size == 0 ? DEFAULT_FRAGMENT_SIZE : fragment_size) {}

bool IstreamByteSource::next(backend::Bytes& fragment) {
  if (input_.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Byte source: Input stream is in a bad state";
    throw StorageError("Byte source: Invalid input stream");
  }
  if (input_.eof()) {
    return false;
  }

  fragment.resize(fragment_size_);
  input_.read(reinterpret_cast<char*>(fragment.data()), static_cast<std::streamsize>(fragment_size_));
  const auto bytes_read = static_cast<std::size_t>(input_.gcount());

  if (input_.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Byte source: Read failed after " << bytes_read << " bytes";
    throw StorageError("Byte source: Failed to read input stream");
  }

  fragment.resize(bytes_read);
  return bytes_read > 0;
}


//==============================================
// BUFFER SOURCE
//==============================================

BufferByteSource::BufferByteSource(backend::Bytes data, std::size_t fragment_size)
  : data_(std::move(data))
  , fragment_size_(fragment_size == 0 ? IstreamByteSource::DEFAULT_FRAGMENT_SIZE : fragment_size) {}

bool BufferByteSource::next(backend::Bytes& fragment) {
  if (position_ >= data_.size()) {
    return false;
  }

  const std::size_t length = std::min(fragment_size_, data_.size() - position_);
  auto first = data_.begin() + static_cast<std::ptrdiff_t>(position_);
  fragment.assign(first, first + static_cast<std::ptrdiff_t>(length));
  position_ += length;
  return true;
}

} // namespace storage
} // namespace chunkvault
