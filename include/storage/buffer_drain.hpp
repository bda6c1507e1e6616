#ifndef CHUNKVAULT_STORAGE_BUFFER_DRAIN_HPP
#define CHUNKVAULT_STORAGE_BUFFER_DRAIN_HPP

#include "backend/storage_backend.hpp"
#include "storage/byte_source.hpp"
#include "storage/memory_probe.hpp"
#include "storage/storage_config.hpp"

namespace chunkvault {
namespace storage {

// Reads the whole source into one buffer. The probe is consulted before the first
// read and then every config.memory_check_interval fragments; a ratio above
// config.memory_pressure_threshold aborts with ResourcePressureError.
backend::Bytes drain_source(ByteSource& source, MemoryProbe& probe, const StorageConfig& config);

} // namespace storage
} // namespace chunkvault

#endif // CHUNKVAULT_STORAGE_BUFFER_DRAIN_HPP
