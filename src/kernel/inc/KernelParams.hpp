#ifndef HVDRIVER_KERNEL_KERNEL_PARAMS_HPP
#define HVDRIVER_KERNEL_KERNEL_PARAMS_HPP
/**
 * @file KernelParams.hpp
 * @brief Guest kernel command-line construction.
 *
 * The command line is built in a fixed order:
 *  1. BASE_KERNEL_PARAMS (identical for every VM)
 *  2. DEBUG_KERNEL_PARAMS or QUIET_KERNEL_PARAMS, by HypervisorConfig::debug
 *  3. User parameters, in the order supplied
 *
 * The resulting token sequence is part of the compatibility contract with
 * the guest kernel and image; do not reorder.
 */

#include "src/config/inc/HypervisorConfig.hpp"
#include "src/helpers/inc/Status.hpp"

#include <array>       // std::array
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace hvdriver {

namespace kernel {

/* ----------------------------- ParamView ----------------------------- */

/// Compile-time kernel parameter. Same rendering rules as config::Param.
struct ParamView {
  std::string_view key;
  std::string_view value;
};

/* ----------------------------- Constants ----------------------------- */

/// Root device, filesystem, timer/i8042 quirks, consoles, crypto and net naming.
inline constexpr std::array<ParamView, 21> BASE_KERNEL_PARAMS{{
    {"root", "/dev/pmem0p1"},
    {"rootflags", "dax,data=ordered,errors=remount-ro"},
    {"rw", ""},
    {"rootfstype", "ext4"},
    {"tsc", "reliable"},
    {"no_timer_check", ""},
    {"rcupdate.rcu_expedited", "1"},
    {"i8042.direct", "1"},
    {"i8042.dumbkbd", "1"},
    {"i8042.nopnp", "1"},
    {"i8042.noaux", "1"},
    {"noreplace-smp", ""},
    {"reboot", "k"},
    {"panic", "1"},
    {"console", "hvc0"},
    {"console", "hvc1"},
    {"initcall_debug", ""},
    {"iommu", "off"},
    {"cryptomgr.notests", ""},
    {"net.ifnames", "0"},
    {"pci", "lastbus=0"},
}};

/// Appended when debug is off.
inline constexpr std::array<ParamView, 2> QUIET_KERNEL_PARAMS{{
    {"quiet", ""},
    {"systemd.show_status", "false"},
}};

/// Appended when debug is on.
inline constexpr std::array<ParamView, 3> DEBUG_KERNEL_PARAMS{{
    {"debug", ""},
    {"systemd.show_status", "true"},
    {"systemd.log_level", "debug"},
}};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Render one parameter as a command-line token.
 * @param key Parameter name, may be empty.
 * @param value Parameter value, may be empty.
 * @param out Receives "key=value", "key" or "value".
 * @return OK, or INVARIANT_VIOLATION when both are empty.
 */
[[nodiscard]] Status serializeParam(std::string_view key, std::string_view value,
                                    std::string& out);

/**
 * @brief Render a parameter list, appending tokens to @p out in order.
 *
 * Parameters with neither key nor value carry nothing and are skipped.
 */
void serializeParams(const std::vector<config::Param>& params, std::vector<std::string>& out);

/**
 * @brief Build the full kernel token sequence for a configuration.
 * @param config Supplies the debug flag and user parameters.
 * @param out Receives the tokens on success, untouched otherwise.
 * @return OK, or INVARIANT_VIOLATION if a built-in block cannot be rendered.
 *         User parameters never fail the build.
 */
[[nodiscard]] Status buildKernelParams(const config::HypervisorConfig& config,
                                       std::vector<std::string>& out);

/**
 * @brief Space-join tokens into the string passed to -append.
 */
[[nodiscard]] std::string joinKernelParams(const std::vector<std::string>& tokens);

} // namespace kernel

} // namespace hvdriver

#endif // HVDRIVER_KERNEL_KERNEL_PARAMS_HPP
