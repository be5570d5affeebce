/**
 * @file MachineType.cpp
 * @brief Machine table lookups.
 */

#include "src/machine/inc/MachineType.hpp"

#include <string> // std::string

namespace hvdriver {

namespace machine {

const MachineInfo* findMachine(std::string_view type) noexcept {
  for (const MachineInfo& INFO : SUPPORTED_MACHINES) {
    if (INFO.type == type) {
      return &INFO;
    }
  }
  return nullptr;
}

Status getMachine(std::string_view type, qemu::Machine& out) {
  const MachineInfo* info = findMachine(type);
  if (info == nullptr) {
    return Status::CONFIG_ERROR;
  }

  out.type = std::string(info->type);
  out.acceleration = std::string(info->acceleration);
  return Status::OK;
}

Capabilities capabilitiesFor(std::string_view type) noexcept {
  Capabilities caps{};
  const MachineInfo* info = findMachine(type);
  if (info != nullptr && info->blockDeviceHotplug) {
    caps.setBlockDeviceHotplugSupport();
  }
  return caps;
}

} // namespace machine

} // namespace hvdriver
