/**
 * @file HypervisorConfig_uTest.cpp
 * @brief Unit tests for hvdriver::config::HypervisorConfig.
 */

#include "src/config/inc/HypervisorConfig.hpp"

#include <gtest/gtest.h>

using hvdriver::Status;
using hvdriver::config::DEFAULT_BRIDGES;
using hvdriver::config::DEFAULT_MEM_SZ_MIB;
using hvdriver::config::DEFAULT_VCPUS;
using hvdriver::config::HypervisorConfig;
using hvdriver::config::Param;

namespace {

HypervisorConfig makeMinimalConfig() {
  HypervisorConfig config{};
  config.kernelPath = "/usr/share/clear-containers/vmlinux.container";
  config.imagePath = "/usr/share/clear-containers/clear-containers.img";
  return config;
}

} // namespace

/** @test Missing kernel path is rejected. */
TEST(HypervisorConfigTest, MissingKernelPath) {
  HypervisorConfig config = makeMinimalConfig();
  config.kernelPath.clear();
  EXPECT_EQ(config.valid(), Status::CONFIG_ERROR);
}

/** @test Missing image path is rejected. */
TEST(HypervisorConfigTest, MissingImagePath) {
  HypervisorConfig config = makeMinimalConfig();
  config.imagePath.clear();
  EXPECT_EQ(config.valid(), Status::CONFIG_ERROR);
}

/** @test Rejected configuration is not defaulted. */
TEST(HypervisorConfigTest, RejectedConfigUnchanged) {
  HypervisorConfig config{};
  const HypervisorConfig BEFORE = config;
  EXPECT_EQ(config.valid(), Status::CONFIG_ERROR);
  EXPECT_EQ(config, BEFORE);
}

/** @test Zero sizes are defaulted; an empty machine type stays empty. */
TEST(HypervisorConfigTest, FillsDefaults) {
  HypervisorConfig config = makeMinimalConfig();
  ASSERT_EQ(config.valid(), Status::OK);

  EXPECT_EQ(config.defaultVcpus, DEFAULT_VCPUS);
  EXPECT_EQ(config.defaultMemSzMiB, DEFAULT_MEM_SZ_MIB);
  EXPECT_EQ(config.defaultBridges, DEFAULT_BRIDGES);
  EXPECT_TRUE(config.machineType.empty());
  EXPECT_TRUE(config.hypervisorPath.empty());
}

/** @test Explicit values survive validation. */
TEST(HypervisorConfigTest, KeepsExplicitValues) {
  HypervisorConfig config = makeMinimalConfig();
  config.defaultVcpus = 4;
  config.defaultMemSzMiB = 512;
  config.defaultBridges = 2;
  config.machineType = "q35";
  config.kernelParams = {Param{"foo", "bar"}};
  const HypervisorConfig BEFORE = config;

  ASSERT_EQ(config.valid(), Status::OK);
  EXPECT_EQ(config, BEFORE);
}

/** @test Machine type is not checked here; that belongs to the machine table. */
TEST(HypervisorConfigTest, MachineTypeNotValidatedHere) {
  HypervisorConfig config = makeMinimalConfig();
  config.machineType = "bogus";
  EXPECT_EQ(config.valid(), Status::OK);
  EXPECT_EQ(config.machineType, "bogus");
}
