#ifndef HVDRIVER_STORAGE_HYPERVISOR_STATE_HPP
#define HVDRIVER_STORAGE_HYPERVISOR_STATE_HPP
/**
 * @file HypervisorState.hpp
 * @brief Persisted driver state and its JSON schema.
 *
 * Schema (version 1):
 * @code
 *   {
 *     "version": 1,
 *     "hypervisorConfig": {
 *       "kernelPath": "...", "imagePath": "...", "hypervisorPath": "...",
 *       "machineType": "...", "defaultVcpus": 1, "defaultMemSzMiB": 2048,
 *       "defaultBridges": 1, "debug": false,
 *       "kernelParams": [ { "key": "...", "value": "..." } ]
 *     },
 *     "hypervisorPath": "/usr/bin/qemu-lite-system-x86_64",
 *     "kernelParams": [ "root=/dev/pmem0p1", ... ]
 *   }
 * @endcode
 *
 * Decoding is strict: a different version, a missing member or a member of
 * the wrong type is a SCHEMA_MISMATCH. Unknown extra members are ignored.
 */

#include "src/config/inc/HypervisorConfig.hpp"
#include "src/helpers/inc/Status.hpp"

#include <cstdint> // std::uint32_t
#include <string>  // std::string
#include <vector>  // std::vector

#include <json/json.h>

namespace hvdriver {

namespace storage {

/* ----------------------------- Constants ----------------------------- */

/// Version written by this build; the only one it reads.
inline constexpr std::uint32_t STATE_SCHEMA_VERSION = 1;

/* ----------------------------- HypervisorState ----------------------------- */

/**
 * @brief What the driver needs to reattach to a pod's VM.
 */
struct HypervisorState {
  std::uint32_t version{STATE_SCHEMA_VERSION};
  config::HypervisorConfig config{};
  std::string hypervisorPath;            ///< Resolved binary
  std::vector<std::string> kernelParams; ///< Built token sequence

  bool operator==(const HypervisorState&) const = default;
};

/* ----------------------------- Codec ----------------------------- */

/// @brief Encode state as a JSON object.
[[nodiscard]] Json::Value toJson(const HypervisorState& state);

/**
 * @brief Decode state from a JSON value.
 * @param value Parsed document.
 * @param out Receives the state on success, untouched otherwise.
 * @return OK or SCHEMA_MISMATCH.
 */
[[nodiscard]] Status fromJson(const Json::Value& value, HypervisorState& out);

/// @brief Serialize state to indented JSON text.
[[nodiscard]] std::string serializeState(const HypervisorState& state);

/**
 * @brief Parse JSON text into state.
 * @return OK, or SCHEMA_MISMATCH when the text is not valid JSON or does not
 *         match the schema.
 */
[[nodiscard]] Status parseState(const std::string& text, HypervisorState& out);

} // namespace storage

} // namespace hvdriver

#endif // HVDRIVER_STORAGE_HYPERVISOR_STATE_HPP
