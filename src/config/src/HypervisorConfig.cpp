/**
 * @file HypervisorConfig.cpp
 * @brief HypervisorConfig validation and defaulting.
 */

#include "src/config/inc/HypervisorConfig.hpp"

namespace hvdriver {

namespace config {

Status HypervisorConfig::valid() {
  if (kernelPath.empty() || imagePath.empty()) {
    return Status::CONFIG_ERROR;
  }

  if (defaultVcpus == 0) {
    defaultVcpus = DEFAULT_VCPUS;
  }
  if (defaultMemSzMiB == 0) {
    defaultMemSzMiB = DEFAULT_MEM_SZ_MIB;
  }
  if (defaultBridges == 0) {
    defaultBridges = DEFAULT_BRIDGES;
  }

  return Status::OK;
}

} // namespace config

} // namespace hvdriver
