#ifndef HVDRIVER_MACHINE_MACHINE_TYPE_HPP
#define HVDRIVER_MACHINE_MACHINE_TYPE_HPP
/**
 * @file MachineType.hpp
 * @brief Supported QEMU machine types and the capabilities they imply.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * The table is closed. Machine type strings are matched exactly and
 * case-sensitively; nothing outside the table is ever accepted or reported
 * as capable of anything.
 */

#include "src/helpers/inc/Status.hpp"
#include "src/qemu/inc/QemuConfig.hpp"

#include <array>       // std::array
#include <cstddef>     // std::size_t
#include <string_view> // std::string_view

namespace hvdriver {

namespace machine {

/* ----------------------------- Constants ----------------------------- */

/// Lightweight PC board used with qemu-lite.
inline constexpr std::string_view QEMU_PC_LITE = "pc-lite";

/// Standard i440FX PC board.
inline constexpr std::string_view QEMU_PC = "pc";

/// Q35 PCI-Express board.
inline constexpr std::string_view QEMU_Q35 = "q35";

/// Machine type used when the configuration names none.
inline constexpr std::string_view DEFAULT_MACHINE_TYPE = QEMU_PC_LITE;

/// Accelerators enabled on every supported machine.
inline constexpr std::string_view DEFAULT_MACHINE_ACCELERATORS = "kvm,kernel_irqchip,nvdimm";

/// Hypervisor binary for pc-lite.
inline constexpr std::string_view QEMU_LITE_PATH = "/usr/bin/qemu-lite-system-x86_64";

/// Hypervisor binary for pc and q35.
inline constexpr std::string_view QEMU_PATH = "/usr/bin/qemu-system-x86_64";

/* ----------------------------- Table ----------------------------- */

/**
 * @brief One row of the machine table.
 */
struct MachineInfo {
  std::string_view type;
  std::string_view acceleration;
  std::string_view defaultPath;  ///< Binary used when no hypervisor path is configured
  bool blockDeviceHotplug;       ///< Live block device hotplug works on this board
};

/// Every machine type the driver accepts.
inline constexpr std::array<MachineInfo, 3> SUPPORTED_MACHINES{{
    {QEMU_PC_LITE, DEFAULT_MACHINE_ACCELERATORS, QEMU_LITE_PATH, false},
    {QEMU_PC, DEFAULT_MACHINE_ACCELERATORS, QEMU_PATH, true},
    {QEMU_Q35, DEFAULT_MACHINE_ACCELERATORS, QEMU_PATH, false},
}};

/* ----------------------------- Capabilities ----------------------------- */

/**
 * @brief Capability flags derived from a machine type.
 */
class Capabilities {
public:
  Capabilities() = default;

  /// @brief Block devices can be attached to a running VM.
  [[nodiscard]] bool isBlockDeviceHotplugSupported() const noexcept { return blockDeviceHotplug_; }

  /// @brief Mark block device hotplug as supported.
  void setBlockDeviceHotplugSupport() noexcept { blockDeviceHotplug_ = true; }

private:
  bool blockDeviceHotplug_{false};
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Look up a machine type in the table.
 * @param type Machine type string, compared exactly.
 * @return Table row, or nullptr if unsupported.
 */
[[nodiscard]] const MachineInfo* findMachine(std::string_view type) noexcept;

/**
 * @brief Validate a machine type and build its -machine section.
 * @param type Machine type string.
 * @param out Receives type and accelerators on success, untouched otherwise.
 * @return OK, or CONFIG_ERROR for anything outside the table.
 */
[[nodiscard]] Status getMachine(std::string_view type, qemu::Machine& out);

/**
 * @brief Capabilities of a machine type.
 * @param type Machine type string; unsupported values yield no capabilities.
 */
[[nodiscard]] Capabilities capabilitiesFor(std::string_view type) noexcept;

} // namespace machine

} // namespace hvdriver

#endif // HVDRIVER_MACHINE_MACHINE_TYPE_HPP
