/**
 * @file Resources_uTest.cpp
 * @brief Unit tests for hvdriver::resources CPU and memory sizing.
 *
 * Notes:
 *  - Expected maxMem is computed through the same HostInfo the code under
 *    test uses, never hard-coded.
 */

#include "src/resources/inc/Resources.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using hvdriver::Status;
using hvdriver::pod::Resources;
using hvdriver::qemu::Memory;
using hvdriver::qemu::Smp;
using hvdriver::resources::DEFAULT_MEM_SLOTS;
using hvdriver::resources::HostInfo;
using hvdriver::resources::MAX_MEMORY_OFFSET_MIB;
using hvdriver::resources::ProcHostInfo;
using hvdriver::resources::setCpuResources;
using hvdriver::resources::setMemoryResources;

namespace {

/// Deterministic host with a configurable memory reading.
class FakeHostInfo final : public HostInfo {
public:
  FakeHostInfo(Status status, std::uint64_t kb) : status_(status), kb_(kb) {}

  Status totalPhysicalMemoryKb(std::uint64_t& kb) const override {
    if (status_ == Status::OK) {
      kb = kb_;
    }
    return status_;
  }

  Status runningOnVmm(bool& nested) const override {
    nested = false;
    return Status::OK;
  }

private:
  Status status_;
  std::uint64_t kb_;
};

} // namespace

/* ----------------------------- CPU ----------------------------- */

/** @test Topology is flat: cpus == cores, one socket, one thread. */
TEST(ResourcesTest, CpuTopologyFlat) {
  const Smp SMP = setCpuResources(Resources{8, 0});
  EXPECT_EQ(SMP.cpus, 8U);
  EXPECT_EQ(SMP.cores, 8U);
  EXPECT_EQ(SMP.sockets, 1U);
  EXPECT_EQ(SMP.threads, 1U);
}

/** @test Single vCPU request. */
TEST(ResourcesTest, CpuSingle) {
  EXPECT_EQ(setCpuResources(Resources{1, 0}), (Smp{1, 1, 1, 1}));
}

/* ----------------------------- Memory ----------------------------- */

/** @test 1000 MiB on the live host yields 1000M, 2 slots, host + offset. */
TEST(ResourcesTest, MemoryAgainstLiveHost) {
  const ProcHostInfo HOST;
  std::uint64_t hostKb = 0;
  ASSERT_EQ(HOST.totalPhysicalMemoryKb(hostKb), Status::OK);
  const std::string EXPECTED_MAX = std::to_string(hostKb / 1024 + MAX_MEMORY_OFFSET_MIB) + "M";

  Memory mem{};
  ASSERT_EQ(setMemoryResources(Resources{1, 1000}, HOST, mem), Status::OK);
  EXPECT_EQ(mem.size, "1000M");
  EXPECT_EQ(mem.slots, DEFAULT_MEM_SLOTS);
  EXPECT_EQ(mem.maxMem, EXPECTED_MAX);
}

/** @test maxMem rounds host KiB down to MiB before adding the offset. */
TEST(ResourcesTest, MemoryFromFakeHost) {
  const FakeHostInfo HOST(Status::OK, 16318412);
  Memory mem{};
  ASSERT_EQ(setMemoryResources(Resources{2, 2048}, HOST, mem), Status::OK);
  EXPECT_EQ(mem.size, "2048M");
  EXPECT_EQ(mem.slots, 2U);
  EXPECT_EQ(mem.maxMem, "16959M"); // 15935 + 1024
}

/** @test Slots and maxMem are present even for a tiny request. */
TEST(ResourcesTest, HotplugReservationAlwaysPresent) {
  const FakeHostInfo HOST(Status::OK, 1024);
  Memory mem{};
  ASSERT_EQ(setMemoryResources(Resources{1, 0}, HOST, mem), Status::OK);
  EXPECT_EQ(mem.size, "0M");
  EXPECT_EQ(mem.slots, DEFAULT_MEM_SLOTS);
  EXPECT_EQ(mem.maxMem, "1025M");
}

/** @test Host errors propagate and leave the output untouched. */
TEST(ResourcesTest, HostErrorPropagates) {
  const Memory BEFORE{"512M", 1, "1M"};
  for (const Status ST : {Status::IO_ERROR, Status::CONFIG_ERROR}) {
    const FakeHostInfo HOST(ST, 0);
    Memory mem = BEFORE;
    EXPECT_EQ(setMemoryResources(Resources{1, 1000}, HOST, mem), ST);
    EXPECT_EQ(mem, BEFORE);
  }
}
