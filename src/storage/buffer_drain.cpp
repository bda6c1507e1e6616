#include "storage/buffer_drain.hpp"
#include <boost/log/trivial.hpp>
#include "storage/storage_error.hpp"

namespace chunkvault {
namespace storage {

namespace {

void check_memory_pressure(MemoryProbe& probe, const StorageConfig& config, std::size_t buffered) {
  const double ratio = probe.usage_ratio();
  if (ratio > config.memory_pressure_threshold) {
    BOOST_LOG_TRIVIAL(warning) << "Buffer drain: Memory usage " << ratio << " above threshold "
                               << config.memory_pressure_threshold << " after " << buffered << " bytes";
    throw ResourcePressureError("memory usage " + std::to_string(ratio) + " exceeds threshold " +
                                std::to_string(config.memory_pressure_threshold));
  }
}

} // namespace

backend::Bytes drain_source(ByteSource& source, MemoryProbe& probe, const StorageConfig& config) {
  const std::size_t interval = config.memory_check_interval == 0 ? 1 : config.memory_check_interval;

  backend::Bytes buffer;
  backend::Bytes fragment;
  std::size_t fragments = 0;

  check_memory_pressure(probe, config, 0);

  while (source.next(fragment)) {
    buffer.insert(buffer.end(), fragment.begin(), fragment.end());
    if (++fragments % interval == 0) {
      check_memory_pressure(probe, config, buffer.size());
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Buffer drain: Drained " << buffer.size() << " bytes in " << fragments << " fragments";
  return buffer;
}

} // namespace storage
} // namespace chunkvault
