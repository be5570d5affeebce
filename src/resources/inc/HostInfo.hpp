#ifndef HVDRIVER_RESOURCES_HOST_INFO_HPP
#define HVDRIVER_RESOURCES_HOST_INFO_HPP
/**
 * @file HostInfo.hpp
 * @brief Host facts the driver needs: physical memory and nested virtualization.
 * @note NOT RT-SAFE: Performs blocking file reads.
 *
 * HostInfo is the seam tests use to supply deterministic host values.
 * ProcHostInfo is the production source, backed by procfs:
 *  - /proc/meminfo  (MemTotal line)
 *  - /proc/cpuinfo  ("hypervisor" CPU flag)
 *
 * Usage:
 * @code
 *   hvdriver::resources::ProcHostInfo host;
 *   std::uint64_t kb = 0;
 *   if (host.totalPhysicalMemoryKb(kb) == hvdriver::Status::OK) {
 *     fmt::print("host memory: {} KiB\n", kb);
 *   }
 * @endcode
 */

#include "src/helpers/inc/Status.hpp"

#include <cstdint> // std::uint64_t
#include <string>  // std::string

namespace hvdriver {

namespace resources {

/* ----------------------------- Constants ----------------------------- */

/// Default memory info source.
inline constexpr const char* PROC_MEMINFO = "/proc/meminfo";

/// Default CPU info source.
inline constexpr const char* PROC_CPUINFO = "/proc/cpuinfo";

/* ----------------------------- HostInfo ----------------------------- */

/**
 * @brief Source of host facts.
 */
class HostInfo {
public:
  virtual ~HostInfo() = default;

  /**
   * @brief Total physical memory of the host.
   * @param kb Receives the MemTotal value in KiB.
   * @return OK, IO_ERROR if the source is unreadable, CONFIG_ERROR if the
   *         value is missing, malformed or zero.
   */
  [[nodiscard]] virtual Status totalPhysicalMemoryKb(std::uint64_t& kb) const = 0;

  /**
   * @brief Whether this host is itself a virtual machine.
   * @param nested Receives true when the CPU reports the hypervisor flag.
   * @return OK, or IO_ERROR if the source is unreadable.
   */
  [[nodiscard]] virtual Status runningOnVmm(bool& nested) const = 0;
};

/* ----------------------------- ProcHostInfo ----------------------------- */

/**
 * @brief HostInfo backed by procfs.
 *
 * Paths are injectable so tests can point at fixture files.
 */
class ProcHostInfo final : public HostInfo {
public:
  explicit ProcHostInfo(std::string memInfoPath = PROC_MEMINFO,
                        std::string cpuInfoPath = PROC_CPUINFO);

  [[nodiscard]] Status totalPhysicalMemoryKb(std::uint64_t& kb) const override;
  [[nodiscard]] Status runningOnVmm(bool& nested) const override;

private:
  std::string memInfoPath_;
  std::string cpuInfoPath_;
};

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Extract MemTotal from /proc/meminfo contents.
 * @param text Null-terminated meminfo text.
 * @param kb Receives the value in KiB on success.
 * @return OK, or CONFIG_ERROR if the line is missing, unparsable or zero.
 */
[[nodiscard]] Status parseMemTotalKb(const char* text, std::uint64_t& kb) noexcept;

/**
 * @brief Check /proc/cpuinfo contents for the "hypervisor" flag.
 * @param text Null-terminated cpuinfo text.
 * @return true if any "flags" line lists the hypervisor word.
 */
[[nodiscard]] bool hasHypervisorFlag(const char* text) noexcept;

} // namespace resources

} // namespace hvdriver

#endif // HVDRIVER_RESOURCES_HOST_INFO_HPP
