#ifndef HVDRIVER_POD_POD_CONFIG_HPP
#define HVDRIVER_POD_POD_CONFIG_HPP
/**
 * @file PodConfig.hpp
 * @brief Read-only view of a pod specification, as consumed by the driver.
 *
 * These are the resource descriptors the pod layer hands down. Parsing them
 * from a runtime spec happens elsewhere; the driver only reads them.
 */

#include "src/config/inc/HypervisorConfig.hpp"

#include <cstdint> // std::uint32_t
#include <map>     // std::map
#include <string>  // std::string
#include <vector>  // std::vector

namespace hvdriver {

namespace pod {

/* ----------------------------- Resource Descriptors ----------------------------- */

/// Host directory shared into the guest.
struct Volume {
  std::string mountTag;
  std::string hostPath;
};

/// Host unix socket exposed as a guest serial port.
struct Socket {
  std::string deviceId;
  std::string id; ///< Character device ID
  std::string hostPath;
  std::string name;
};

/// Host file exposed as a guest block device.
struct Drive {
  std::string file;
  std::string format;
  std::string id;
};

/// Host PCI function passed through to the guest.
struct VfioDevice {
  std::string bdf;
};

/// vhost-user network interface.
struct VhostUserNetDevice {
  std::string id;
  std::string socketPath;
  std::string macAddress;
};

/* ----------------------------- Pod ----------------------------- */

/// Requested VM sizing.
struct Resources {
  std::uint32_t vcpus{0};
  std::uint32_t memoryMiB{0};
};

/// One container of the pod.
struct ContainerConfig {
  std::string id;
  std::string rootFs;
};

/// Pod specification.
struct PodConfig {
  std::string id;
  config::HypervisorConfig hypervisorConfig{};
  Resources vmConfig{};
  std::vector<Volume> volumes;
  std::vector<ContainerConfig> containers;
  std::map<std::string, std::string> annotations;
};

} // namespace pod

} // namespace hvdriver

#endif // HVDRIVER_POD_POD_CONFIG_HPP
