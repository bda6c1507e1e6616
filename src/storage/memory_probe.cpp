#include "storage/memory_probe.hpp"
#include <unistd.h>
#include <algorithm>
#include <fstream>
#include <string>
#include <boost/log/trivial.hpp>
#include "storage/storage_error.hpp"

namespace chunkvault {
namespace storage {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ProcessMemoryProbe::ProcessMemoryProbe()
  : ProcessMemoryProbe("/proc/self/statm", "/sys/fs/cgroup/memory.max") {}

ProcessMemoryProbe::ProcessMemoryProbe(std::filesystem::path statm_path,
                                       std::filesystem::path cgroup_limit_path)
  : statm_path_(std::move(statm_path))
  , cgroup_limit_path_(std::move(cgroup_limit_path))
  , page_size_(static_cast<std::uint64_t>(sysconf(_SC_PAGESIZE))) {}


//==============================================
// QUERY OPERATIONS
//==============================================

double ProcessMemoryProbe::usage_ratio() {
  const std::uint64_t limit = limit_bytes();
  if (limit == 0) {
    return 0.0;
  }
  return static_cast<double>(resident_bytes()) / static_cast<double>(limit);
}

std::uint64_t ProcessMemoryProbe::resident_bytes() const {
  // statm: size resident shared text lib data dt, in pages
  std::ifstream statm(statm_path_);
  std::uint64_t size_pages = 0;
  std::uint64_t resident_pages = 0;
  if (!(statm >> size_pages >> resident_pages)) {
    BOOST_LOG_TRIVIAL(error) << "Memory probe: Failed to read " << statm_path_.string();
    throw StorageError("Memory probe: Failed to read " + statm_path_.string());
  }
  return resident_pages * page_size_;
}

std::uint64_t ProcessMemoryProbe::limit_bytes() const {
  const auto physical_pages = sysconf(_SC_PHYS_PAGES);
  std::uint64_t limit = physical_pages > 0 ? static_cast<std::uint64_t>(physical_pages) * page_size_ : 0;

  // cgroup v2 writes "max" when no limit is set
  std::ifstream cgroup(cgroup_limit_path_);
  std::string value;
  if (cgroup >> value && value != "max") {
    try {
      const std::uint64_t cgroup_limit = std::stoull(value);
      limit = limit == 0 ? cgroup_limit : std::min(limit, cgroup_limit);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(warning) << "Memory probe: Ignoring unreadable cgroup limit '" << value << "': " << e.what();
    }
  }
  return limit;
}

} // namespace storage
} // namespace chunkvault
