#ifndef HVDRIVER_QEMU_QEMU_PARAMS_HPP
#define HVDRIVER_QEMU_QEMU_PARAMS_HPP
/**
 * @file QemuParams.hpp
 * @brief Render device descriptors and VM configuration as QEMU arguments.
 *
 * Output is an argv-style vector (option and value as separate elements)
 * suitable for execv. The binary path itself is not included.
 *
 * @note Cold path: allocates.
 */

#include "src/qemu/inc/Device.hpp"
#include "src/qemu/inc/QemuConfig.hpp"

#include <string> // std::string
#include <vector> // std::vector

namespace hvdriver {

namespace qemu {

/**
 * @brief Arguments creating one device.
 *
 * Backend options (-fsdev, -chardev, -drive, -object) precede the front-end
 * -device that references them.
 */
[[nodiscard]] std::vector<std::string> toQemuParams(const Device& device);

/**
 * @brief Arguments for a whole VM.
 *
 * Order: name, machine, cpu, qmp, smp, memory, rtc, devices (list order),
 * kernel, then global switches.
 *
 * Empty sections (no machine type, zero CPUs, no memory size, no kernel) are
 * omitted.
 */
[[nodiscard]] std::vector<std::string> toQemuParams(const QemuConfig& config);

} // namespace qemu

} // namespace hvdriver

#endif // HVDRIVER_QEMU_QEMU_PARAMS_HPP
