#include "backend/memory_backend.hpp"
#include <boost/log/trivial.hpp>
#include "backend/key_pattern.hpp"

namespace chunkvault {
namespace backend {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

MemoryBackend::MemoryBackend() {
  BOOST_LOG_TRIVIAL(info) << "Memory backend: Initializing in-memory key/value store";
}


//==============================================
// SCALAR OPERATIONS
//==============================================

std::optional<std::string> MemoryBackend::get(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = values_.find(key);
  if (it == values_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Memory backend: Key not found: " << key;
    return std::nullopt;
  }

  if (const auto* text = std::get_if<std::string>(&it->second)) {
    BOOST_LOG_TRIVIAL(trace) << "Memory backend: Retrieved text for key: " << key;
    return *text;
  }

  BOOST_LOG_TRIVIAL(debug) << "Memory backend: Key holds binary value, not text: " << key;
  return std::nullopt;
}

std::optional<Bytes> MemoryBackend::get_binary(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = values_.find(key);
  if (it == values_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Memory backend: Key not found: " << key;
    return std::nullopt;
  }

  if (const auto* binary = std::get_if<Bytes>(&it->second)) {
    BOOST_LOG_TRIVIAL(trace) << "Memory backend: Retrieved " << binary->size() << " bytes for key: " << key;
    return *binary;
  }

  BOOST_LOG_TRIVIAL(debug) << "Memory backend: Key holds text value, not binary: " << key;
  return std::nullopt;
}

void MemoryBackend::set(const std::string& key, const std::string& value) {
  std::lock_guard<std::mutex> lock(mutex_);
  values_[key] = value;
  BOOST_LOG_TRIVIAL(trace) << "Memory backend: Stored text (" << value.size() << " chars) for key: " << key;
}

void MemoryBackend::set_binary(const std::string& key, const Bytes& value) {
  std::lock_guard<std::mutex> lock(mutex_);
  values_[key] = value;
  BOOST_LOG_TRIVIAL(trace) << "Memory backend: Stored " << value.size() << " bytes for key: " << key;
}


//==============================================
// LIST OPERATIONS
//==============================================

void MemoryBackend::append_to_list(const std::string& list_key, const std::string& value) {
  std::lock_guard<std::mutex> lock(mutex_);
  lists_[list_key].push_back(value);
  BOOST_LOG_TRIVIAL(trace) << "Memory backend: Appended to list " << list_key
                           << ", length now " << lists_[list_key].size();
}

std::vector<std::string> MemoryBackend::get_full_list(const std::string& list_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = lists_.find(list_key);
  if (it == lists_.end()) {
    return {};
  }
  return it->second;
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<std::string> MemoryBackend::list_keys(const std::string& pattern) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> keys;
  for (const auto& entry : values_) {
    if (matches_pattern(pattern, entry.first)) {
      keys.push_back(entry.first);
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Memory backend: " << keys.size() << " keys match pattern: " << pattern;
  return keys;
}

std::size_t MemoryBackend::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return values_.size();
}

void MemoryBackend::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  values_.clear();
  lists_.clear();
  BOOST_LOG_TRIVIAL(info) << "Memory backend: Store cleared";
}

} // namespace backend
} // namespace chunkvault
