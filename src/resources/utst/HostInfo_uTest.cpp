/**
 * @file HostInfo_uTest.cpp
 * @brief Unit tests for hvdriver::resources host info parsing.
 *
 * Notes:
 *  - Parsing is tested against fixed text; ProcHostInfo against fixture
 *    files under a per-test temporary directory.
 *  - Live /proc checks assert relations only.
 */

#include "src/resources/inc/HostInfo.hpp"
#include "src/helpers/inc/Files.hpp"

#include <gtest/gtest.h>

#include <stdlib.h> // mkdtemp

#include <cstdint>
#include <filesystem>
#include <string>

using hvdriver::Status;
using hvdriver::helpers::files::writeFileAtomic;
using hvdriver::resources::hasHypervisorFlag;
using hvdriver::resources::parseMemTotalKb;
using hvdriver::resources::ProcHostInfo;

namespace {

constexpr const char* MEMINFO_SAMPLE = "MemTotal:       16318412 kB\n"
                                       "MemFree:         8812648 kB\n"
                                       "MemAvailable:   12401072 kB\n";

constexpr const char* CPUINFO_VM = "processor\t: 0\n"
                                   "vendor_id\t: GenuineIntel\n"
                                   "flags\t\t: fpu vme de pse tsc msr hypervisor lahf_lm\n"
                                   "\n";

constexpr const char* CPUINFO_METAL = "processor\t: 0\n"
                                      "vendor_id\t: GenuineIntel\n"
                                      "flags\t\t: fpu vme de pse tsc msr vmx lahf_lm\n"
                                      "\n";

} // namespace

/* ----------------------------- parseMemTotalKb ----------------------------- */

/** @test MemTotal is extracted in KiB. */
TEST(HostInfoParseTest, MemTotalParsed) {
  std::uint64_t kb = 0;
  ASSERT_EQ(parseMemTotalKb(MEMINFO_SAMPLE, kb), Status::OK);
  EXPECT_EQ(kb, 16318412U);
}

/** @test MemTotal need not be the first line. */
TEST(HostInfoParseTest, MemTotalAnyLine) {
  std::uint64_t kb = 0;
  ASSERT_EQ(parseMemTotalKb("MemFree: 10 kB\nMemTotal: 2048 kB\n", kb), Status::OK);
  EXPECT_EQ(kb, 2048U);
}

/** @test Missing MemTotal is a configuration error. */
TEST(HostInfoParseTest, MemTotalMissing) {
  std::uint64_t kb = 7;
  EXPECT_EQ(parseMemTotalKb("MemFree: 10 kB\n", kb), Status::CONFIG_ERROR);
  EXPECT_EQ(parseMemTotalKb("", kb), Status::CONFIG_ERROR);
  EXPECT_EQ(parseMemTotalKb(nullptr, kb), Status::CONFIG_ERROR);
  EXPECT_EQ(kb, 7U);
}

/** @test Non-numeric MemTotal is a configuration error. */
TEST(HostInfoParseTest, MemTotalMalformed) {
  std::uint64_t kb = 0;
  EXPECT_EQ(parseMemTotalKb("MemTotal: lots kB\n", kb), Status::CONFIG_ERROR);
  EXPECT_EQ(parseMemTotalKb("MemTotal: -5 kB\n", kb), Status::CONFIG_ERROR);
  EXPECT_EQ(parseMemTotalKb("MemTotal:\n42 kB\n", kb), Status::CONFIG_ERROR);
}

/** @test Zero MemTotal is a configuration error. */
TEST(HostInfoParseTest, MemTotalZero) {
  std::uint64_t kb = 0;
  EXPECT_EQ(parseMemTotalKb("MemTotal: 0 kB\n", kb), Status::CONFIG_ERROR);
}

/** @test MemTotal beyond 64 bits is a configuration error. */
TEST(HostInfoParseTest, MemTotalOverflow) {
  std::uint64_t kb = 7;
  EXPECT_EQ(parseMemTotalKb("MemTotal: 99999999999999999999999 kB\n", kb), Status::CONFIG_ERROR);
  EXPECT_EQ(kb, 7U);

  ASSERT_EQ(parseMemTotalKb("MemTotal: 18446744073709551614 kB\n", kb), Status::OK);
  EXPECT_EQ(kb, 18446744073709551614ULL);
}

/* ----------------------------- hasHypervisorFlag ----------------------------- */

/** @test hypervisor flag marks a nested run. */
TEST(HostInfoParseTest, HypervisorFlagPresent) { EXPECT_TRUE(hasHypervisorFlag(CPUINFO_VM)); }

/** @test Bare metal has no hypervisor flag. */
TEST(HostInfoParseTest, HypervisorFlagAbsent) {
  EXPECT_FALSE(hasHypervisorFlag(CPUINFO_METAL));
  EXPECT_FALSE(hasHypervisorFlag(""));
  EXPECT_FALSE(hasHypervisorFlag(nullptr));
}

/** @test Only whole words on a flags line count. */
TEST(HostInfoParseTest, HypervisorFlagWholeWord) {
  EXPECT_FALSE(hasHypervisorFlag("flags\t\t: fpu hypervisors\n"));
  EXPECT_FALSE(hasHypervisorFlag("model name\t: hypervisor edition\n"));
}

/* ----------------------------- ProcHostInfo ----------------------------- */

class ProcHostInfoTest : public ::testing::Test {
protected:
  std::string dir_;

  void SetUp() override {
    char tmpl[] = "/tmp/hvdriver-hostinfo-XXXXXX";
    ASSERT_NE(::mkdtemp(tmpl), nullptr);
    dir_ = tmpl;
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::string fixture(const char* name, const char* contents) {
    const std::string PATH = dir_ + "/" + name;
    EXPECT_TRUE(writeFileAtomic(PATH, contents));
    return PATH;
  }
};

/** @test Fixture meminfo is read through the injected path. */
TEST_F(ProcHostInfoTest, ReadsInjectedMemInfo) {
  const ProcHostInfo HOST(fixture("meminfo", MEMINFO_SAMPLE), fixture("cpuinfo", CPUINFO_METAL));
  std::uint64_t kb = 0;
  ASSERT_EQ(HOST.totalPhysicalMemoryKb(kb), Status::OK);
  EXPECT_EQ(kb, 16318412U);
}

/** @test Fixture cpuinfo drives nested detection. */
TEST_F(ProcHostInfoTest, ReadsInjectedCpuInfo) {
  const ProcHostInfo VM(fixture("meminfo", MEMINFO_SAMPLE), fixture("cpuinfo-vm", CPUINFO_VM));
  const ProcHostInfo METAL(fixture("meminfo", MEMINFO_SAMPLE), fixture("cpuinfo", CPUINFO_METAL));

  bool nested = false;
  ASSERT_EQ(VM.runningOnVmm(nested), Status::OK);
  EXPECT_TRUE(nested);
  ASSERT_EQ(METAL.runningOnVmm(nested), Status::OK);
  EXPECT_FALSE(nested);
}

/** @test Unreadable sources are I/O errors, not configuration errors. */
TEST_F(ProcHostInfoTest, MissingFilesAreIoErrors) {
  const ProcHostInfo HOST(dir_ + "/nope-meminfo", dir_ + "/nope-cpuinfo");
  std::uint64_t kb = 0;
  bool nested = false;
  EXPECT_EQ(HOST.totalPhysicalMemoryKb(kb), Status::IO_ERROR);
  EXPECT_EQ(HOST.runningOnVmm(nested), Status::IO_ERROR);
}

/** @test Empty meminfo is readable but has no MemTotal. */
TEST_F(ProcHostInfoTest, EmptyMemInfoIsConfigError) {
  const ProcHostInfo HOST(fixture("meminfo", ""), fixture("cpuinfo", CPUINFO_METAL));
  std::uint64_t kb = 0;
  EXPECT_EQ(HOST.totalPhysicalMemoryKb(kb), Status::CONFIG_ERROR);
}

/** @test Live /proc/meminfo reports a positive total. */
TEST(ProcHostInfoLiveTest, HostMemoryPositive) {
  const ProcHostInfo HOST;
  std::uint64_t kb = 0;
  ASSERT_EQ(HOST.totalPhysicalMemoryKb(kb), Status::OK);
  EXPECT_GT(kb, 0U);
}
