#ifndef CHUNKVAULT_STORAGE_KEY_LAYOUT_HPP
#define CHUNKVAULT_STORAGE_KEY_LAYOUT_HPP

#include <string>

namespace chunkvault {
namespace storage {

// Persisted key layout inside the backend:
//   chunk:{fileName}:{index}  binary chunk payload
//   meta:{fileName}           serialized FileMetadata
//   uploaded_files            append-only list of file names

inline const std::string FILE_INDEX_KEY = "uploaded_files";

inline std::string chunk_key(const std::string& file_name, std::size_t index) {
  return "chunk:" + file_name + ":" + std::to_string(index);
}

inline std::string meta_key(const std::string& file_name) {
  return "meta:" + file_name;
}

} // namespace storage
} // namespace chunkvault

#endif // CHUNKVAULT_STORAGE_KEY_LAYOUT_HPP
