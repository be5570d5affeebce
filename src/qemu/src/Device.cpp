/**
 * @file Device.cpp
 * @brief QEMU spellings of device enums and descriptor accessors.
 */

#include "src/qemu/inc/Device.hpp"

#include <type_traits> // std::decay_t, std::is_same_v
#include <variant>     // std::visit

namespace hvdriver {

namespace qemu {

/* ----------------------------- Enum Strings ----------------------------- */

const char* toString(DeviceDriver driver) noexcept {
  switch (driver) {
  case DeviceDriver::NVDIMM:
    return "nvdimm";
  case DeviceDriver::VIRTIO_9P:
    return "virtio-9p-pci";
  case DeviceDriver::VIRTIO_SERIAL:
    return "virtio-serial-pci";
  case DeviceDriver::VIRTIO_SERIAL_PORT:
    return "virtserialport";
  case DeviceDriver::VIRTIO_BLOCK:
    return "virtio-blk";
  case DeviceDriver::CONSOLE:
    return "virtconsole";
  case DeviceDriver::VFIO:
    return "vfio-pci";
  }
  return "unknown";
}

const char* toString(FsDriver driver) noexcept {
  switch (driver) {
  case FsDriver::LOCAL:
    return "local";
  }
  return "unknown";
}

const char* toString(SecurityModel model) noexcept {
  switch (model) {
  case SecurityModel::NONE:
    return "none";
  }
  return "unknown";
}

const char* toString(CharBackend backend) noexcept {
  switch (backend) {
  case CharBackend::SOCKET:
    return "socket";
  }
  return "unknown";
}

const char* toString(BlockAio aio) noexcept {
  switch (aio) {
  case BlockAio::THREADS:
    return "threads";
  }
  return "unknown";
}

const char* toString(ObjectType type) noexcept {
  switch (type) {
  case ObjectType::MEMORY_BACKEND_FILE:
    return "memory-backend-file";
  }
  return "unknown";
}

const char* toString(VhostUserType type) noexcept {
  switch (type) {
  case VhostUserType::NETWORK:
    return "virtio-net-pci";
  }
  return "unknown";
}

/* ----------------------------- Accessors ----------------------------- */

namespace {

/// One short label per Device alternative.
struct KindVisitor {
  const char* operator()(const FsDevice&) const noexcept { return "fs"; }
  const char* operator()(const CharDevice&) const noexcept { return "char"; }
  const char* operator()(const SerialDevice&) const noexcept { return "serial"; }
  const char* operator()(const BlockDevice&) const noexcept { return "block"; }
  const char* operator()(const VfioDevice&) const noexcept { return "vfio"; }
  const char* operator()(const VhostUserDevice&) const noexcept { return "vhost-user"; }
  const char* operator()(const MemoryObject&) const noexcept { return "object"; }
};

} // namespace

std::string deviceId(const Device& device) {
  return std::visit(
      [](const auto& dev) -> std::string {
        using T = std::decay_t<decltype(dev)>;
        if constexpr (std::is_same_v<T, FsDevice> || std::is_same_v<T, SerialDevice> ||
                      std::is_same_v<T, BlockDevice>) {
          return dev.id;
        } else if constexpr (std::is_same_v<T, CharDevice> || std::is_same_v<T, MemoryObject>) {
          return dev.deviceId;
        } else if constexpr (std::is_same_v<T, VfioDevice>) {
          return dev.bdf;
        } else {
          return dev.typeDevId;
        }
      },
      device);
}

const char* kindOf(const Device& device) noexcept {
  return std::visit(KindVisitor{}, device);
}

} // namespace qemu

} // namespace hvdriver
