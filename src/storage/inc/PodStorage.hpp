#ifndef HVDRIVER_STORAGE_POD_STORAGE_HPP
#define HVDRIVER_STORAGE_POD_STORAGE_HPP
/**
 * @file PodStorage.hpp
 * @brief Per-pod persisted state and per-pod runtime paths.
 * @note NOT RT-SAFE: Performs blocking file I/O.
 *
 * Layout under the run storage root:
 * @code
 *   <root>/<podId>/hypervisor.json   persisted HypervisorState
 *   <root>/<podId>/console.sock      guest console socket
 *   <root>/<podId>/monitor.sock      QMP socket
 * @endcode
 *
 * The pod directory is created by whoever creates the pod. Storage never
 * creates it; writing into a missing directory is an IO_ERROR.
 */

#include "src/helpers/inc/Status.hpp"
#include "src/storage/inc/HypervisorState.hpp"

#include <string>      // std::string
#include <string_view> // std::string_view

namespace hvdriver {

namespace storage {

/* ----------------------------- Constants ----------------------------- */

/// Default run storage root.
inline constexpr std::string_view DEFAULT_RUN_STORAGE_PATH = "/run/virtcontainers/pods";

/// Persisted driver state file name.
inline constexpr std::string_view HYPERVISOR_STATE_FILE = "hypervisor.json";

/// Console socket file name.
inline constexpr std::string_view DEFAULT_CONSOLE = "console.sock";

/// QMP socket file name.
inline constexpr std::string_view MONITOR_SOCKET = "monitor.sock";

/* ----------------------------- Paths ----------------------------- */

/// @brief <root>/<podId>
[[nodiscard]] std::string podDirectory(std::string_view root, std::string_view podId);

/// @brief <root>/<podId>/console.sock. Pure, no I/O.
[[nodiscard]] std::string consolePath(std::string_view root, std::string_view podId);

/// @brief <root>/<podId>/monitor.sock. Pure, no I/O.
[[nodiscard]] std::string monitorPath(std::string_view root, std::string_view podId);

/// @brief <root>/<podId>/hypervisor.json. Pure, no I/O.
[[nodiscard]] std::string statePath(std::string_view root, std::string_view podId);

/* ----------------------------- PodStorage ----------------------------- */

/**
 * @brief Storage collaborator consumed by the driver.
 */
class PodStorage {
public:
  virtual ~PodStorage() = default;

  /// @brief Root under which every pod directory lives.
  [[nodiscard]] virtual const std::string& runStoragePath() const noexcept = 0;

  /**
   * @brief Read persisted state for a pod.
   * @param podId Pod identifier.
   * @param state Receives the state when found.
   * @param found Set to false when nothing was persisted.
   * @return OK (found or not), IO_ERROR if the file exists but cannot be
   *         read, SCHEMA_MISMATCH if it does not decode.
   */
  [[nodiscard]] virtual Status fetchHypervisorState(const std::string& podId,
                                                    HypervisorState& state, bool& found) = 0;

  /**
   * @brief Persist state for a pod, replacing any previous state.
   * @return OK, or IO_ERROR if the pod directory is missing or the write fails.
   */
  [[nodiscard]] virtual Status storeHypervisorState(const std::string& podId,
                                                    const HypervisorState& state) = 0;
};

/* ----------------------------- FilesystemStorage ----------------------------- */

/**
 * @brief PodStorage backed by JSON files under a root directory.
 *
 * Writes are atomic (temporary file then rename): a failed store leaves the
 * previous file, or no file, behind.
 */
class FilesystemStorage final : public PodStorage {
public:
  explicit FilesystemStorage(std::string root = std::string(DEFAULT_RUN_STORAGE_PATH));

  [[nodiscard]] const std::string& runStoragePath() const noexcept override { return root_; }

  [[nodiscard]] Status fetchHypervisorState(const std::string& podId, HypervisorState& state,
                                            bool& found) override;

  [[nodiscard]] Status storeHypervisorState(const std::string& podId,
                                            const HypervisorState& state) override;

private:
  std::string root_;
};

} // namespace storage

} // namespace hvdriver

#endif // HVDRIVER_STORAGE_POD_STORAGE_HPP
