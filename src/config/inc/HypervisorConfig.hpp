#ifndef HVDRIVER_CONFIG_HYPERVISOR_CONFIG_HPP
#define HVDRIVER_CONFIG_HYPERVISOR_CONFIG_HPP
/**
 * @file HypervisorConfig.hpp
 * @brief Static hypervisor configuration of one pod.
 *
 * Built by the pod layer, checked and defaulted once by valid() at driver
 * initialization, then treated as immutable.
 */

#include "src/helpers/inc/Status.hpp"

#include <cstdint> // std::uint32_t
#include <string>  // std::string
#include <vector>  // std::vector

namespace hvdriver {

namespace config {

/* ----------------------------- Constants ----------------------------- */

/// vCPUs when the configuration requests none.
inline constexpr std::uint32_t DEFAULT_VCPUS = 1;

/// Guest memory (MiB) when the configuration requests none.
inline constexpr std::uint32_t DEFAULT_MEM_SZ_MIB = 2048;

/// PCI bridges when the configuration requests none.
inline constexpr std::uint32_t DEFAULT_BRIDGES = 1;

/* ----------------------------- Param ----------------------------- */

/**
 * @brief One kernel command-line parameter.
 *
 * Rendered as "key=value", "key" when the value is empty, or "value" when
 * the key is empty.
 */
struct Param {
  std::string key;
  std::string value;

  bool operator==(const Param&) const = default;
};

/* ----------------------------- HypervisorConfig ----------------------------- */

/**
 * @brief Paths, sizing defaults and kernel parameters for the hypervisor.
 */
struct HypervisorConfig {
  std::string kernelPath;     ///< Guest kernel image
  std::string imagePath;      ///< Guest root filesystem image
  std::string hypervisorPath; ///< QEMU binary; empty selects the machine default
  std::string machineType;    ///< Empty selects machine::DEFAULT_MACHINE_TYPE

  std::uint32_t defaultVcpus{0};
  std::uint32_t defaultMemSzMiB{0};
  std::uint32_t defaultBridges{0};

  std::vector<Param> kernelParams; ///< User-supplied, appended last in order
  bool debug{false};

  /**
   * @brief Check required fields and fill unset sizing defaults.
   * @return OK, or CONFIG_ERROR when the kernel or image path is missing.
   *         On error the configuration is left unchanged.
   * @note An empty machine type is kept as is; the driver resolves it when
   *       it selects the machine.
   */
  [[nodiscard]] Status valid();

  bool operator==(const HypervisorConfig&) const = default;
};

} // namespace config

} // namespace hvdriver

#endif // HVDRIVER_CONFIG_HYPERVISOR_CONFIG_HPP
