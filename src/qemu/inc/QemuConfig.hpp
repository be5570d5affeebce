#ifndef HVDRIVER_QEMU_QEMU_CONFIG_HPP
#define HVDRIVER_QEMU_QEMU_CONFIG_HPP
/**
 * @file QemuConfig.hpp
 * @brief Complete pre-boot configuration of one QEMU virtual machine.
 *
 * Owned by the driver of a single pod. Not synchronized: callers serialize
 * every mutation of one QemuConfig.
 */

#include "src/qemu/inc/Device.hpp"

#include <cstdint> // std::uint8_t, std::uint32_t
#include <string>  // std::string
#include <vector>  // std::vector

namespace hvdriver {

namespace qemu {

/* ----------------------------- Sections ----------------------------- */

/// Emulated board and accelerators (-machine).
struct Machine {
  std::string type;
  std::string acceleration;

  bool operator==(const Machine&) const = default;
};

/// Flat CPU topology (-smp).
struct Smp {
  std::uint32_t cpus{0};
  std::uint32_t cores{0};
  std::uint32_t sockets{0};
  std::uint32_t threads{0};

  bool operator==(const Smp&) const = default;
};

/// Boot memory plus hotplug reservation (-m).
struct Memory {
  std::string size;   ///< e.g. "2048M"
  std::uint8_t slots{0};
  std::string maxMem; ///< e.g. "17024M"

  bool operator==(const Memory&) const = default;
};

/// Guest kernel and command line (-kernel, -append).
struct Kernel {
  std::string path;
  std::string params;

  bool operator==(const Kernel&) const = default;
};

/// Global QEMU switches.
struct Knobs {
  bool noUserConfig{false}; ///< -no-user-config
  bool noDefaults{false};   ///< -nodefaults
  bool noGraphic{false};    ///< -nographic
  bool daemonize{false};    ///< -daemonize

  bool operator==(const Knobs&) const = default;
};

/// Real-time clock (-rtc).
struct Rtc {
  std::string base;
  std::string driftFix;

  bool operator==(const Rtc&) const = default;
};

/* ----------------------------- QemuConfig ----------------------------- */

/**
 * @brief Everything needed to render a QEMU command line.
 *
 * The device list is append-only during the pre-boot phase. nestedRun is
 * scoped to the VM instance: it is set once from host detection and read by
 * every device appender.
 */
struct QemuConfig {
  std::string name;
  std::string path; ///< Hypervisor binary
  Machine machine{};
  Smp smp{};
  Memory memory{};
  Kernel kernel{};
  std::string cpuModel;
  std::string qmpSocketPath;
  Knobs knobs{};
  Rtc rtc{};
  std::vector<Device> devices;
  bool nestedRun{false};

  bool operator==(const QemuConfig&) const = default;
};

} // namespace qemu

} // namespace hvdriver

#endif // HVDRIVER_QEMU_QEMU_CONFIG_HPP
