#ifndef HVDRIVER_HELPERS_STATUS_HPP
#define HVDRIVER_HELPERS_STATUS_HPP
/**
 * @file Status.hpp
 * @brief Status codes shared by every hvdriver module.
 *
 * Fallible operations return a Status and write their result through an
 * out-parameter. Nothing in the driver layer throws or aborts.
 */

#include <cstdint>

namespace hvdriver {

/* ----------------------------- Status ----------------------------- */

/**
 * @brief Result of a driver operation.
 */
enum class Status : std::uint8_t {
  OK = 0,
  CONFIG_ERROR,        ///< Invalid input: machine type, config, host memory reading
  IO_ERROR,            ///< File could not be opened, read, written or stat'd
  SCHEMA_MISMATCH,     ///< Persisted state does not match the expected schema
  INVARIANT_VIOLATION, ///< Internal construction failure, never expected at runtime
};

/**
 * @brief Human-readable status string.
 * @note Returns pointer to static string.
 */
[[nodiscard]] inline const char* toString(Status status) noexcept {
  switch (status) {
  case Status::OK:
    return "OK";
  case Status::CONFIG_ERROR:
    return "CONFIG_ERROR";
  case Status::IO_ERROR:
    return "IO_ERROR";
  case Status::SCHEMA_MISMATCH:
    return "SCHEMA_MISMATCH";
  case Status::INVARIANT_VIOLATION:
    return "INVARIANT_VIOLATION";
  }
  return "UNKNOWN";
}

} // namespace hvdriver

#endif // HVDRIVER_HELPERS_STATUS_HPP
