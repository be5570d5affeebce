/**
 * @file DeviceAppend.cpp
 * @brief Descriptor to QEMU device translation.
 */

#include "src/device/inc/DeviceAppend.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Log.hpp"

#include <cstddef> // std::size_t
#include <cstdint> // std::uint64_t
#include <utility> // std::move
#include <variant> // std::visit

#include <fmt/core.h>

namespace hvdriver {

namespace device {

namespace log = hvdriver::helpers::log;

namespace {

/// Exhaustive DeviceInfo visitor. A new alternative without an overload here
/// does not compile.
struct AppendVisitor {
  qemu::QemuConfig& config;

  void operator()(const pod::Volume& v) const { appendVolume(config, v); }
  void operator()(const pod::Socket& s) const { appendSocket(config, s); }
  void operator()(const pod::Drive& d) const { appendBlockDevice(config, d); }
  void operator()(const pod::VfioDevice& v) const { appendVfioDevice(config, v); }
  void operator()(const pod::VhostUserNetDevice& n) const { appendVhostUserDevice(config, n); }
};

} // namespace

/* ----------------------------- DeviceType ----------------------------- */

const char* toString(DeviceType type) noexcept {
  switch (type) {
  case DeviceType::FS:
    return "fs";
  case DeviceType::SERIAL_PORT:
    return "serial-port";
  case DeviceType::BLOCK:
    return "block";
  case DeviceType::VFIO:
    return "vfio";
  case DeviceType::VHOST_USER:
    return "vhost-user";
  }
  return "unknown";
}

/* ----------------------------- Appenders ----------------------------- */

void appendVolume(qemu::QemuConfig& config, const pod::Volume& volume) {
  qemu::FsDevice dev{};
  dev.id = fmt::format("{}{}", FS_DEVICE_ID_PREFIX, volume.mountTag);
  dev.path = volume.hostPath;
  dev.mountTag = volume.mountTag;
  dev.disableModern = config.nestedRun;
  config.devices.emplace_back(std::move(dev));
}

void appendSocket(qemu::QemuConfig& config, const pod::Socket& socket) {
  qemu::CharDevice dev{};
  dev.driver = qemu::DeviceDriver::VIRTIO_SERIAL_PORT;
  dev.deviceId = socket.deviceId;
  dev.id = socket.id;
  dev.path = socket.hostPath;
  dev.name = socket.name;
  config.devices.emplace_back(std::move(dev));
}

void appendBlockDevice(qemu::QemuConfig& config, const pod::Drive& drive) {
  qemu::BlockDevice dev{};
  dev.id = drive.id;
  dev.file = drive.file;
  dev.format = drive.format;
  dev.disableModern = config.nestedRun;
  config.devices.emplace_back(std::move(dev));
}

void appendVfioDevice(qemu::QemuConfig& config, const pod::VfioDevice& vfio) {
  config.devices.emplace_back(qemu::VfioDevice{vfio.bdf});
}

void appendVhostUserDevice(qemu::QemuConfig& config, const pod::VhostUserNetDevice& net) {
  qemu::VhostUserDevice dev{};
  dev.socketPath = net.socketPath;
  dev.charDevId = fmt::format("{}{}", VHOST_USER_CHAR_PREFIX, net.id);
  dev.typeDevId = fmt::format("{}{}", VHOST_USER_NET_PREFIX, net.id);
  dev.address = net.macAddress;
  config.devices.emplace_back(std::move(dev));
}

void appendFsDevices(qemu::QemuConfig& config, const pod::PodConfig& podConfig) {
  for (const pod::Volume& v : podConfig.volumes) {
    appendVolume(config, v);
  }
}

void appendConsoles(qemu::QemuConfig& config, const std::string& consolePath) {
  qemu::SerialDevice serial{};
  serial.id = std::string(SERIAL_DEVICE_ID);
  serial.disableModern = config.nestedRun;

  qemu::CharDevice console{};
  console.driver = qemu::DeviceDriver::CONSOLE;
  console.deviceId = std::string(CONSOLE_DEVICE_ID);
  console.id = std::string(CONSOLE_CHARDEV_ID);
  console.path = consolePath;

  config.devices.reserve(config.devices.size() + 2);
  config.devices.emplace_back(std::move(serial));
  config.devices.emplace_back(std::move(console));
}

Status appendImage(qemu::QemuConfig& config, const std::string& imagePath) {
  std::uint64_t size = 0;
  if (!hvdriver::helpers::files::fileSize(imagePath, size)) {
    log::error("cannot stat guest image {}", imagePath);
    return Status::IO_ERROR;
  }

  qemu::MemoryObject obj{};
  obj.deviceId = std::string(IMAGE_DEVICE_ID);
  obj.id = std::string(IMAGE_OBJECT_ID);
  obj.memPath = imagePath;
  obj.size = size;
  config.devices.emplace_back(std::move(obj));
  return Status::OK;
}

/* ----------------------------- Dispatch ----------------------------- */

Status addDevice(qemu::QemuConfig& config, DeviceType type, const DeviceInfo& info) {
  if (info.index() != static_cast<std::size_t>(type)) {
    log::error("device type {} does not match descriptor", toString(type));
    return Status::CONFIG_ERROR;
  }

  std::visit(AppendVisitor{config}, info);
  log::debug("added {} device {}", toString(type), qemu::deviceId(config.devices.back()));
  return Status::OK;
}

} // namespace device

} // namespace hvdriver
