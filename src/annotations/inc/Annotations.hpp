#ifndef HVDRIVER_ANNOTATIONS_ANNOTATIONS_HPP
#define HVDRIVER_ANNOTATIONS_ANNOTATIONS_HPP
/**
 * @file Annotations.hpp
 * @brief Pod annotations that override hypervisor assets.
 *
 * A pod may carry per-pod kernel and image paths, optionally pinned by a
 * hash. Hashes are accepted and type-checked here; verifying them against
 * the asset contents is the asset loader's job.
 */

#include "src/config/inc/HypervisorConfig.hpp"
#include "src/helpers/inc/Status.hpp"

#include <map>         // std::map
#include <string>      // std::string
#include <string_view> // std::string_view

namespace hvdriver {

namespace annotations {

/* ----------------------------- Constants ----------------------------- */

/// Namespace shared by every driver annotation.
inline constexpr std::string_view ANNOTATIONS_PREFIX = "com.github.containers.virtcontainers.";

/// Per-pod guest kernel path.
inline constexpr std::string_view KERNEL_PATH = "com.github.containers.virtcontainers.KernelPath";

/// Per-pod guest image path.
inline constexpr std::string_view IMAGE_PATH = "com.github.containers.virtcontainers.ImagePath";

/// SHA-512 of the kernel named by KERNEL_PATH.
inline constexpr std::string_view KERNEL_HASH = "com.github.containers.virtcontainers.KernelHash";

/// SHA-512 of the image named by IMAGE_PATH.
inline constexpr std::string_view IMAGE_HASH = "com.github.containers.virtcontainers.ImageHash";

/// Algorithm of the asset hashes.
inline constexpr std::string_view ASSET_HASH_TYPE =
    "com.github.containers.virtcontainers.AssetHashType";

/// The only supported asset hash algorithm.
inline constexpr std::string_view SHA512 = "sha512";

/* ----------------------------- API ----------------------------- */

/**
 * @brief Apply kernel and image path annotations to a configuration.
 * @param annotations Pod annotations.
 * @param config Updated in place on success, untouched on failure.
 * @return OK, or CONFIG_ERROR when a hash is given with an unsupported hash
 *         type or an override path is empty.
 */
[[nodiscard]] Status applyAssetAnnotations(const std::map<std::string, std::string>& annotations,
                                           config::HypervisorConfig& config);

} // namespace annotations

} // namespace hvdriver

#endif // HVDRIVER_ANNOTATIONS_ANNOTATIONS_HPP
