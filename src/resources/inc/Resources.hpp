#ifndef HVDRIVER_RESOURCES_RESOURCES_HPP
#define HVDRIVER_RESOURCES_RESOURCES_HPP
/**
 * @file Resources.hpp
 * @brief CPU topology and memory sizing derived from a resource request.
 *
 * Topology is flat: one socket, one thread per core, cores == cpus.
 * Memory always reserves hotplug slots and a maximum bound of host memory
 * plus MAX_MEMORY_OFFSET_MIB, whether or not hotplug is ever used.
 */

#include "src/helpers/inc/Status.hpp"
#include "src/pod/inc/PodConfig.hpp"
#include "src/qemu/inc/QemuConfig.hpp"
#include "src/resources/inc/HostInfo.hpp"

#include <cstdint> // std::uint8_t, std::uint64_t

namespace hvdriver {

namespace resources {

/* ----------------------------- Constants ----------------------------- */

/// Added to host memory (MiB) to form the -m maxmem bound.
inline constexpr std::uint64_t MAX_MEMORY_OFFSET_MIB = 1024;

/// Memory hotplug slots reserved on every VM.
inline constexpr std::uint8_t DEFAULT_MEM_SLOTS = 2;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Build the -smp section for a request.
 * @param request Requested vCPUs.
 * @return cpus = cores = request.vcpus, sockets = threads = 1.
 */
[[nodiscard]] qemu::Smp setCpuResources(const pod::Resources& request) noexcept;

/**
 * @brief Build the -m section for a request.
 * @param request Requested memory in MiB.
 * @param host Source of host physical memory.
 * @param out Receives size, slots and maxMem on success, untouched otherwise.
 * @return OK, or the HostInfo error when host memory cannot be determined.
 */
[[nodiscard]] Status setMemoryResources(const pod::Resources& request, const HostInfo& host,
                                        qemu::Memory& out);

} // namespace resources

} // namespace hvdriver

#endif // HVDRIVER_RESOURCES_RESOURCES_HPP
