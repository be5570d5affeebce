/**
 * @file Resources.cpp
 * @brief CPU and memory sizing.
 */

#include "src/resources/inc/Resources.hpp"
#include "src/helpers/inc/Format.hpp"

namespace hvdriver {

namespace resources {

using hvdriver::helpers::format::mebibytes;

qemu::Smp setCpuResources(const pod::Resources& request) noexcept {
  qemu::Smp smp{};
  smp.cpus = request.vcpus;
  smp.cores = request.vcpus;
  smp.sockets = 1;
  smp.threads = 1;
  return smp;
}

Status setMemoryResources(const pod::Resources& request, const HostInfo& host,
                          qemu::Memory& out) {
  std::uint64_t hostKb = 0;
  const Status ST = host.totalPhysicalMemoryKb(hostKb);
  if (ST != Status::OK) {
    return ST;
  }

  const std::uint64_t HOST_MIB = hostKb / 1024;

  out.size = mebibytes(request.memoryMiB);
  out.slots = DEFAULT_MEM_SLOTS;
  out.maxMem = mebibytes(HOST_MIB + MAX_MEMORY_OFFSET_MIB);
  return Status::OK;
}

} // namespace resources

} // namespace hvdriver
