#ifndef CHUNKVAULT_STORAGE_MEMORY_PROBE_HPP
#define CHUNKVAULT_STORAGE_MEMORY_PROBE_HPP

#include <cstdint>
#include <filesystem>

namespace chunkvault {
namespace storage {

// Reports how much of the memory available to the process is in use
class MemoryProbe {
public:
  virtual ~MemoryProbe() = default;

  // Fraction in [0, 1] (may exceed 1 under overcommit)
  virtual double usage_ratio() = 0;
};

// Resident set size of this process over the tighter of physical memory and the
// cgroup v2 memory limit
class ProcessMemoryProbe : public MemoryProbe {
public:
  ProcessMemoryProbe();
  // Lets tests point the probe at fixture files instead of /proc and /sys
  ProcessMemoryProbe(std::filesystem::path statm_path, std::filesystem::path cgroup_limit_path);

  double usage_ratio() override;

  // ---- QUERY OPERATIONS ----
  std::uint64_t resident_bytes() const;
  std::uint64_t limit_bytes() const;

private:
  std::filesystem::path statm_path_;
  std::filesystem::path cgroup_limit_path_;
  std::uint64_t page_size_;
};

} // namespace storage
} // namespace chunkvault

#endif // CHUNKVAULT_STORAGE_MEMORY_PROBE_HPP
