#ifndef CHUNKVAULT_STORAGE_STORAGE_CONFIG_HPP
#define CHUNKVAULT_STORAGE_STORAGE_CONFIG_HPP

#include <cstddef>

namespace chunkvault {
namespace storage {

struct StorageConfig {
  // Hard ceiling on chunk size, matches the 512 MiB Redis per-value limit
  std::size_t max_chunk_size{512ull * 1024 * 1024};
  // Fraction of available memory in use above which an upload drain aborts
  double memory_pressure_threshold{0.9};
  // Number of fragments read between memory-pressure checks
  std::size_t memory_check_interval{8};
};

} // namespace storage
} // namespace chunkvault

#endif // CHUNKVAULT_STORAGE_STORAGE_CONFIG_HPP
