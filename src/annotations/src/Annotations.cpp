/**
 * @file Annotations.cpp
 * @brief Asset annotation handling.
 */

#include "src/annotations/inc/Annotations.hpp"
#include "src/helpers/inc/Log.hpp"

namespace hvdriver {

namespace annotations {

namespace log = hvdriver::helpers::log;

namespace {

using AnnotationMap = std::map<std::string, std::string>;

const std::string* lookup(const AnnotationMap& annotations, std::string_view key) {
  const auto IT = annotations.find(std::string(key));
  return (IT == annotations.end()) ? nullptr : &IT->second;
}

} // namespace

Status applyAssetAnnotations(const AnnotationMap& annotations, config::HypervisorConfig& config) {
  const std::string* kernelPath = lookup(annotations, KERNEL_PATH);
  const std::string* imagePath = lookup(annotations, IMAGE_PATH);
  const std::string* kernelHash = lookup(annotations, KERNEL_HASH);
  const std::string* imageHash = lookup(annotations, IMAGE_HASH);
  const std::string* hashType = lookup(annotations, ASSET_HASH_TYPE);

  if ((kernelHash != nullptr || imageHash != nullptr) && hashType != nullptr &&
      *hashType != SHA512) {
    log::error("unsupported asset hash type '{}'", *hashType);
    return Status::CONFIG_ERROR;
  }
  if ((kernelPath != nullptr && kernelPath->empty()) ||
      (imagePath != nullptr && imagePath->empty())) {
    log::error("empty asset path annotation");
    return Status::CONFIG_ERROR;
  }

  if (kernelPath != nullptr) {
    log::debug("kernel path overridden by annotation: {}", *kernelPath);
    config.kernelPath = *kernelPath;
  }
  if (imagePath != nullptr) {
    log::debug("image path overridden by annotation: {}", *imagePath);
    config.imagePath = *imagePath;
  }
  return Status::OK;
}

} // namespace annotations

} // namespace hvdriver
