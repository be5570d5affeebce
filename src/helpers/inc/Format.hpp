#ifndef HVDRIVER_HELPERS_FORMAT_HPP
#define HVDRIVER_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Size formatting for hypervisor arguments and diagnostic output.
 *
 * @note All functions return std::string. Cold paths only.
 */

#include <cstdint>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

namespace hvdriver {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format a MiB count the way QEMU's -m option expects it.
 * @param mib Size in mebibytes.
 * @return "<mib>M", e.g. "2048M".
 */
[[nodiscard]] inline std::string mebibytes(std::uint64_t mib) { return fmt::format("{}M", mib); }

/**
 * @brief Format bytes using binary units (KiB, MiB, GiB, TiB).
 * @param bytes Byte count.
 * @return Formatted string (e.g., "1.5 GiB").
 */
[[nodiscard]] inline std::string bytesBinary(std::uint64_t bytes) {
  if (bytes == 0) {
    return "0 B";
  }

  static constexpr std::uint64_t KIB = 1024ULL;
  static constexpr std::uint64_t MIB = KIB * 1024ULL;
  static constexpr std::uint64_t GIB = MIB * 1024ULL;
  static constexpr std::uint64_t TIB = GIB * 1024ULL;

  if (bytes >= TIB) {
    return fmt::format("{:.1f} TiB", static_cast<double>(bytes) / static_cast<double>(TIB));
  }
  if (bytes >= GIB) {
    return fmt::format("{:.1f} GiB", static_cast<double>(bytes) / static_cast<double>(GIB));
  }
  if (bytes >= MIB) {
    return fmt::format("{:.1f} MiB", static_cast<double>(bytes) / static_cast<double>(MIB));
  }
  if (bytes >= KIB) {
    return fmt::format("{:.1f} KiB", static_cast<double>(bytes) / static_cast<double>(KIB));
  }

  return fmt::format("{} B", bytes);
}

} // namespace format
} // namespace helpers
} // namespace hvdriver

#endif // HVDRIVER_HELPERS_FORMAT_HPP
