#ifndef HVDRIVER_DEVICE_DEVICE_APPEND_HPP
#define HVDRIVER_DEVICE_DEVICE_APPEND_HPP
/**
 * @file DeviceAppend.hpp
 * @brief Translate pod resource descriptors into QEMU devices.
 * @note NOT thread-safe: Callers serialize all mutations of one QemuConfig.
 *
 * Every appender only pushes onto QemuConfig::devices; existing entries are
 * never touched. Device IDs follow fixed naming rules:
 *  - Volume       extra-9p-<mountTag>
 *  - Consoles     serial0, console0 / charconsole0
 *  - Image        nv0 (nvdimm) / mem0 (memory backend)
 *  - vhost-user   char-<id> / net-<id>
 *
 * Under a nested run (QemuConfig::nestedRun) FS, block and serial devices
 * disable virtio modern negotiation.
 *
 * addDevice() is the entry point for external callers. The per-variant
 * appenders are building blocks for addDevice() and pod creation.
 */

#include "src/helpers/inc/Status.hpp"
#include "src/pod/inc/PodConfig.hpp"
#include "src/qemu/inc/QemuConfig.hpp"

#include <cstdint>     // std::uint8_t
#include <string>      // std::string
#include <string_view> // std::string_view
#include <variant>     // std::variant

namespace hvdriver {

namespace device {

/* ----------------------------- Constants ----------------------------- */

/// Prefix for 9p share IDs.
inline constexpr std::string_view FS_DEVICE_ID_PREFIX = "extra-9p-";

/// Prefix for vhost-user character device IDs.
inline constexpr std::string_view VHOST_USER_CHAR_PREFIX = "char-";

/// Prefix for vhost-user netdev IDs.
inline constexpr std::string_view VHOST_USER_NET_PREFIX = "net-";

inline constexpr std::string_view SERIAL_DEVICE_ID = "serial0";
inline constexpr std::string_view CONSOLE_DEVICE_ID = "console0";
inline constexpr std::string_view CONSOLE_CHARDEV_ID = "charconsole0";

inline constexpr std::string_view IMAGE_DEVICE_ID = "nv0";
inline constexpr std::string_view IMAGE_OBJECT_ID = "mem0";

/* ----------------------------- DeviceType ----------------------------- */

/**
 * @brief Device kind requested through addDevice().
 *
 * Values index DeviceInfo alternatives one-to-one.
 */
enum class DeviceType : std::uint8_t {
  FS = 0,      ///< pod::Volume
  SERIAL_PORT, ///< pod::Socket
  BLOCK,       ///< pod::Drive
  VFIO,        ///< pod::VfioDevice
  VHOST_USER,  ///< pod::VhostUserNetDevice
};

/// @brief Human-readable device type.
[[nodiscard]] const char* toString(DeviceType type) noexcept;

/// Descriptor accepted by addDevice().
using DeviceInfo = std::variant<pod::Volume, pod::Socket, pod::Drive, pod::VfioDevice,
                                pod::VhostUserNetDevice>;

/* ----------------------------- Appenders ----------------------------- */

/// @brief Append one 9p share for a volume.
void appendVolume(qemu::QemuConfig& config, const pod::Volume& volume);

/// @brief Append one virtio serial port backed by a host socket.
void appendSocket(qemu::QemuConfig& config, const pod::Socket& socket);

/// @brief Append one virtio block device.
void appendBlockDevice(qemu::QemuConfig& config, const pod::Drive& drive);

/// @brief Append one VFIO passthrough device.
void appendVfioDevice(qemu::QemuConfig& config, const pod::VfioDevice& vfio);

/// @brief Append one vhost-user network device.
void appendVhostUserDevice(qemu::QemuConfig& config, const pod::VhostUserNetDevice& net);

/**
 * @brief Append one 9p share per pod volume, in volume order.
 * @note The container list does not contribute devices.
 */
void appendFsDevices(qemu::QemuConfig& config, const pod::PodConfig& podConfig);

/**
 * @brief Append the serial controller and the pod console.
 * @param consolePath Host socket backing the console.
 */
void appendConsoles(qemu::QemuConfig& config, const std::string& consolePath);

/**
 * @brief Append the guest image as an nvdimm backed by the image file.
 * @param imagePath Image file; its size becomes the object size.
 * @return OK, or IO_ERROR if the image cannot be opened or stat'd, in which
 *         case nothing is appended.
 */
[[nodiscard]] Status appendImage(qemu::QemuConfig& config, const std::string& imagePath);

/* ----------------------------- Dispatch ----------------------------- */

/**
 * @brief Append the device described by @p info.
 * @param type Requested kind; must match the alternative held by @p info.
 * @return OK, or CONFIG_ERROR on a type mismatch (nothing appended).
 */
[[nodiscard]] Status addDevice(qemu::QemuConfig& config, DeviceType type, const DeviceInfo& info);

} // namespace device

} // namespace hvdriver

#endif // HVDRIVER_DEVICE_DEVICE_APPEND_HPP
