/**
 * @file Annotations_uTest.cpp
 * @brief Unit tests for hvdriver::annotations asset overrides.
 */

#include "src/annotations/inc/Annotations.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <string_view>

using hvdriver::Status;
using hvdriver::annotations::ANNOTATIONS_PREFIX;
using hvdriver::annotations::applyAssetAnnotations;
using hvdriver::annotations::ASSET_HASH_TYPE;
using hvdriver::annotations::IMAGE_HASH;
using hvdriver::annotations::IMAGE_PATH;
using hvdriver::annotations::KERNEL_HASH;
using hvdriver::annotations::KERNEL_PATH;
using hvdriver::config::HypervisorConfig;

using Annotations = std::map<std::string, std::string>;

namespace {

HypervisorConfig baseConfig() {
  HypervisorConfig config{};
  config.kernelPath = "/usr/share/clear-containers/vmlinux.container";
  config.imagePath = "/usr/share/clear-containers/clear-containers.img";
  return config;
}

std::string key(std::string_view k) { return std::string(k); }

} // namespace

/** @test Every key lives under the shared prefix. */
TEST(AnnotationsTest, KeysUnderPrefix) {
  for (const std::string_view K : {KERNEL_PATH, IMAGE_PATH, KERNEL_HASH, IMAGE_HASH, ASSET_HASH_TYPE}) {
    EXPECT_EQ(K.substr(0, ANNOTATIONS_PREFIX.size()), ANNOTATIONS_PREFIX) << K;
  }
  EXPECT_EQ(KERNEL_PATH.substr(ANNOTATIONS_PREFIX.size()), "KernelPath");
  EXPECT_EQ(ASSET_HASH_TYPE.substr(ANNOTATIONS_PREFIX.size()), "AssetHashType");
}

/** @test No annotations leaves the configuration alone. */
TEST(AnnotationsTest, NoAnnotations) {
  HypervisorConfig config = baseConfig();
  ASSERT_EQ(applyAssetAnnotations({}, config), Status::OK);
  EXPECT_EQ(config, baseConfig());
}

/** @test Path annotations override kernel and image. */
TEST(AnnotationsTest, PathsOverride) {
  HypervisorConfig config = baseConfig();
  const Annotations A = {{key(KERNEL_PATH), "/opt/kernel"}, {key(IMAGE_PATH), "/opt/image"}};
  ASSERT_EQ(applyAssetAnnotations(A, config), Status::OK);
  EXPECT_EQ(config.kernelPath, "/opt/kernel");
  EXPECT_EQ(config.imagePath, "/opt/image");
}

/** @test Unrelated annotations are ignored. */
TEST(AnnotationsTest, UnrelatedIgnored) {
  HypervisorConfig config = baseConfig();
  const Annotations A = {{"io.kubernetes.cri.sandbox-id", "abc"}, {"KernelPath", "/x"}};
  ASSERT_EQ(applyAssetAnnotations(A, config), Status::OK);
  EXPECT_EQ(config, baseConfig());
}

/** @test sha512 or an absent hash type are accepted with a hash. */
TEST(AnnotationsTest, SupportedHashType) {
  HypervisorConfig config = baseConfig();
  Annotations a = {{key(KERNEL_PATH), "/opt/kernel"}, {key(KERNEL_HASH), "abcd"}};
  EXPECT_EQ(applyAssetAnnotations(a, config), Status::OK);

  a[key(ASSET_HASH_TYPE)] = "sha512";
  EXPECT_EQ(applyAssetAnnotations(a, config), Status::OK);
  EXPECT_EQ(config.kernelPath, "/opt/kernel");
}

/** @test Any other hash type is rejected and nothing is applied. */
TEST(AnnotationsTest, UnsupportedHashType) {
  HypervisorConfig config = baseConfig();
  const Annotations A = {{key(IMAGE_PATH), "/opt/image"},
                         {key(IMAGE_HASH), "abcd"},
                         {key(ASSET_HASH_TYPE), "md5"}};
  EXPECT_EQ(applyAssetAnnotations(A, config), Status::CONFIG_ERROR);
  EXPECT_EQ(config, baseConfig());
}

/** @test Hash type without any hash is not checked. */
TEST(AnnotationsTest, HashTypeWithoutHash) {
  HypervisorConfig config = baseConfig();
  const Annotations A = {{key(ASSET_HASH_TYPE), "md5"}};
  EXPECT_EQ(applyAssetAnnotations(A, config), Status::OK);
}

/** @test Empty override path is rejected. */
TEST(AnnotationsTest, EmptyPathRejected) {
  HypervisorConfig config = baseConfig();
  const Annotations A = {{key(KERNEL_PATH), ""}};
  EXPECT_EQ(applyAssetAnnotations(A, config), Status::CONFIG_ERROR);
  EXPECT_EQ(config, baseConfig());
}
