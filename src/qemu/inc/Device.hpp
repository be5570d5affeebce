#ifndef HVDRIVER_QEMU_DEVICE_HPP
#define HVDRIVER_QEMU_DEVICE_HPP
/**
 * @file Device.hpp
 * @brief Device descriptors handed to the QEMU command-line renderer.
 *
 * Each descriptor carries exactly the fields QEMU needs to create one guest
 * device. Descriptors are plain values: once appended to a device list they
 * are never modified.
 */

#include <cstdint> // std::uint64_t
#include <string>  // std::string
#include <variant> // std::variant

namespace hvdriver {

namespace qemu {

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief QEMU device driver names.
 */
enum class DeviceDriver : std::uint8_t {
  NVDIMM = 0,         ///< nvdimm
  VIRTIO_9P,          ///< virtio-9p-pci
  VIRTIO_SERIAL,      ///< virtio-serial-pci
  VIRTIO_SERIAL_PORT, ///< virtserialport
  VIRTIO_BLOCK,       ///< virtio-blk
  CONSOLE,            ///< virtconsole
  VFIO,               ///< vfio-pci
};

/// @brief Driver name as QEMU spells it.
[[nodiscard]] const char* toString(DeviceDriver driver) noexcept;

/**
 * @brief Filesystem share backends (-fsdev).
 */
enum class FsDriver : std::uint8_t {
  LOCAL = 0, ///< local
};

[[nodiscard]] const char* toString(FsDriver driver) noexcept;

/**
 * @brief 9p security models.
 */
enum class SecurityModel : std::uint8_t {
  NONE = 0, ///< none
};

[[nodiscard]] const char* toString(SecurityModel model) noexcept;

/**
 * @brief Character device backends (-chardev).
 */
enum class CharBackend : std::uint8_t {
  SOCKET = 0, ///< socket
};

[[nodiscard]] const char* toString(CharBackend backend) noexcept;

/**
 * @brief Block device asynchronous I/O modes.
 */
enum class BlockAio : std::uint8_t {
  THREADS = 0, ///< threads
};

[[nodiscard]] const char* toString(BlockAio aio) noexcept;

/**
 * @brief Memory backend object types (-object).
 */
enum class ObjectType : std::uint8_t {
  MEMORY_BACKEND_FILE = 0, ///< memory-backend-file
};

[[nodiscard]] const char* toString(ObjectType type) noexcept;

/**
 * @brief vhost-user device kinds.
 */
enum class VhostUserType : std::uint8_t {
  NETWORK = 0, ///< virtio-net-pci front-end over a vhost-user netdev
};

[[nodiscard]] const char* toString(VhostUserType type) noexcept;

/* ----------------------------- Descriptors ----------------------------- */

/// 9p filesystem share.
struct FsDevice {
  DeviceDriver driver{DeviceDriver::VIRTIO_9P};
  FsDriver fsDriver{FsDriver::LOCAL};
  std::string id;
  std::string path;
  std::string mountTag;
  SecurityModel securityModel{SecurityModel::NONE};
  bool disableModern{false};

  bool operator==(const FsDevice&) const = default;
};

/// Socket-backed character device (serial port or console).
struct CharDevice {
  DeviceDriver driver{DeviceDriver::VIRTIO_SERIAL_PORT};
  CharBackend backend{CharBackend::SOCKET};
  std::string deviceId; ///< Front-end device ID
  std::string id;       ///< Character device (backend) ID
  std::string path;
  std::string name; ///< Port name seen by the guest, empty for consoles

  bool operator==(const CharDevice&) const = default;
};

/// virtio-serial controller.
struct SerialDevice {
  DeviceDriver driver{DeviceDriver::VIRTIO_SERIAL};
  std::string id;
  bool disableModern{false};

  bool operator==(const SerialDevice&) const = default;
};

/// virtio block device backed by a host file.
struct BlockDevice {
  DeviceDriver driver{DeviceDriver::VIRTIO_BLOCK};
  std::string id;
  std::string file;
  BlockAio aio{BlockAio::THREADS};
  std::string format; ///< Image format, passed through verbatim
  std::string interface{"none"};
  bool disableModern{false};

  bool operator==(const BlockDevice&) const = default;
};

/// PCI passthrough device.
struct VfioDevice {
  std::string bdf; ///< Host bus:device.function

  bool operator==(const VfioDevice&) const = default;
};

/// vhost-user accelerated device.
struct VhostUserDevice {
  std::string socketPath;
  std::string charDevId;
  std::string typeDevId;
  std::string address; ///< MAC address
  VhostUserType vhostUserType{VhostUserType::NETWORK};

  bool operator==(const VhostUserDevice&) const = default;
};

/// Memory backend object exposed to the guest through a front-end device.
struct MemoryObject {
  DeviceDriver driver{DeviceDriver::NVDIMM};
  ObjectType type{ObjectType::MEMORY_BACKEND_FILE};
  std::string deviceId; ///< Front-end (nvdimm) device ID
  std::string id;       ///< Memory backend object ID
  std::string memPath;
  std::uint64_t size{0}; ///< Bytes

  bool operator==(const MemoryObject&) const = default;
};

/**
 * @brief One attachable guest device.
 *
 * Closed set: a new device kind is added here and in every visitor.
 */
using Device = std::variant<FsDevice, CharDevice, SerialDevice, BlockDevice, VfioDevice,
                            VhostUserDevice, MemoryObject>;

/**
 * @brief Identifier under which the device is known to QEMU.
 * @note The front-end device ID where one exists, the BDF for passthrough.
 */
[[nodiscard]] std::string deviceId(const Device& device);

/**
 * @brief Short kind label ("fs", "char", "serial", "block", "vfio",
 *        "vhost-user", "object").
 */
[[nodiscard]] const char* kindOf(const Device& device) noexcept;

} // namespace qemu

} // namespace hvdriver

#endif // HVDRIVER_QEMU_DEVICE_HPP
