#ifndef HVDRIVER_HYPERVISOR_QEMU_HPP
#define HVDRIVER_HYPERVISOR_QEMU_HPP
/**
 * @file Qemu.hpp
 * @brief QEMU driver for one pod: initialization, restore and boot config.
 * @note NOT thread-safe: One Qemu instance is owned by the workflow that
 *       manages its pod. Callers serialize every call.
 *
 * Lifecycle:
 *  1. init()      Validate the configuration, then either restore the
 *                 persisted state of the pod or build it fresh (binary path,
 *                 kernel command line) and persist it.
 *  2. createPod() Fill the boot configuration: machine, sizing, kernel, QMP
 *                 socket, then FS shares, consoles and the guest image.
 *  3. addDevice() Append further devices before the VM is launched.
 *
 * Every fallible call either succeeds or leaves the driver exactly as it was.
 *
 * Usage:
 * @code
 *   hvdriver::storage::FilesystemStorage storage;
 *   hvdriver::resources::ProcHostInfo host;
 *   hvdriver::hypervisor::Qemu q(storage, host);
 *
 *   if (q.init(podConfig) == hvdriver::Status::OK &&
 *       q.createPod(podConfig) == hvdriver::Status::OK) {
 *     const auto ARGS = hvdriver::qemu::toQemuParams(q.qemuConfig());
 *   }
 * @endcode
 */

#include "src/config/inc/HypervisorConfig.hpp"
#include "src/device/inc/DeviceAppend.hpp"
#include "src/helpers/inc/Status.hpp"
#include "src/machine/inc/MachineType.hpp"
#include "src/pod/inc/PodConfig.hpp"
#include "src/qemu/inc/QemuConfig.hpp"
#include "src/resources/inc/HostInfo.hpp"
#include "src/storage/inc/PodStorage.hpp"

#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace hvdriver {

namespace hypervisor {

/* ----------------------------- Constants ----------------------------- */

/// VM name prefix; the pod ID follows.
inline constexpr std::string_view POD_NAME_PREFIX = "pod-";

/// Guest CPU model.
inline constexpr std::string_view CPU_MODEL = "host";

/// Guest CPU model under a nested run (no PMU passthrough).
inline constexpr std::string_view CPU_MODEL_NESTED = "host,pmu=off";

inline constexpr std::string_view RTC_BASE = "utc";
inline constexpr std::string_view RTC_DRIFT_FIX = "slew";

/* ----------------------------- Qemu ----------------------------- */

/**
 * @brief Hypervisor driver bound to one pod.
 *
 * Storage and host info are borrowed; both must outlive the driver.
 */
class Qemu {
public:
  Qemu(storage::PodStorage& storage, const resources::HostInfo& host) noexcept;

  /**
   * @brief Initialize from a pod identifier and configuration.
   * @param podId Pod identifier; its storage directory must already exist
   *              unless state was persisted before.
   * @param config Hypervisor configuration; validated and defaulted.
   * @return OK; CONFIG_ERROR for an invalid configuration or machine type;
   *         IO_ERROR for unreadable host info or state, or a missing pod
   *         directory; SCHEMA_MISMATCH for foreign persisted state;
   *         INVARIANT_VIOLATION if the kernel command line cannot be built.
   *
   * Persisted state, when present, takes precedence over @p config.
   */
  [[nodiscard]] Status init(const std::string& podId, const config::HypervisorConfig& config);

  /**
   * @brief Initialize from a pod specification.
   *
   * Applies the pod's asset annotations to its hypervisor configuration,
   * then behaves like init(podId, config).
   */
  [[nodiscard]] Status init(const pod::PodConfig& podConfig);

  /**
   * @brief Console socket of a pod: <runStoragePath>/<podId>/console.sock.
   * @note Pure: no I/O, does not require init().
   */
  [[nodiscard]] std::string getPodConsole(const std::string& podId) const;

  /// @brief Capabilities of the configured machine type.
  [[nodiscard]] machine::Capabilities capabilities() const noexcept;

  /**
   * @brief Build the boot configuration for the initialized pod.
   * @param podConfig Pod whose ID matches the one given to init().
   * @return OK; CONFIG_ERROR if not initialized or the pod ID differs;
   *         the HostInfo error if host memory is unavailable; IO_ERROR if
   *         the guest image cannot be stat'd.
   *
   * Replaces any previous boot configuration. Zero vCPU or memory requests
   * fall back to the configuration defaults.
   */
  [[nodiscard]] Status createPod(const pod::PodConfig& podConfig);

  /**
   * @brief Append a device to the boot configuration.
   * @return OK, or CONFIG_ERROR if @p type does not match @p info.
   */
  [[nodiscard]] Status addDevice(const device::DeviceInfo& info, device::DeviceType type);

  /* ----------------------------- Accessors ----------------------------- */

  [[nodiscard]] bool initialized() const noexcept { return initialized_; }
  [[nodiscard]] const std::string& podId() const noexcept { return podId_; }
  [[nodiscard]] const config::HypervisorConfig& config() const noexcept { return config_; }

  /// @brief Resolved hypervisor binary.
  [[nodiscard]] const std::string& path() const noexcept { return path_; }

  /// @brief Kernel command-line tokens.
  [[nodiscard]] const std::vector<std::string>& kernelParams() const noexcept {
    return kernelParams_;
  }

  [[nodiscard]] const qemu::QemuConfig& qemuConfig() const noexcept { return qemuConfig_; }
  [[nodiscard]] bool nestedRun() const noexcept { return qemuConfig_.nestedRun; }

private:
  storage::PodStorage& storage_;
  const resources::HostInfo& host_;

  bool initialized_{false};
  std::string podId_;
  config::HypervisorConfig config_{};
  std::string path_;
  std::vector<std::string> kernelParams_;
  qemu::QemuConfig qemuConfig_{};
};

} // namespace hypervisor

} // namespace hvdriver

#endif // HVDRIVER_HYPERVISOR_QEMU_HPP
