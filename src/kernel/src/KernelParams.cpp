/**
 * @file KernelParams.cpp
 * @brief Kernel command-line construction.
 */

#include "src/kernel/inc/KernelParams.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cstddef> // std::size_t
#include <utility> // std::move

#include <fmt/core.h>

namespace hvdriver {

namespace kernel {

namespace {

template <std::size_t N>
Status appendBlock(const std::array<ParamView, N>& block, std::vector<std::string>& out) {
  for (const ParamView& p : block) {
    std::string token;
    const Status ST = serializeParam(p.key, p.value, token);
    if (ST != Status::OK) {
      return ST;
    }
    out.push_back(std::move(token));
  }
  return Status::OK;
}

} // namespace

/* ----------------------------- API ----------------------------- */

Status serializeParam(std::string_view key, std::string_view value, std::string& out) {
  if (key.empty() && value.empty()) {
    return Status::INVARIANT_VIOLATION;
  }
  if (value.empty()) {
    out.assign(key);
  } else if (key.empty()) {
    out.assign(value);
  } else {
    out = fmt::format("{}={}", key, value);
  }
  return Status::OK;
}

void serializeParams(const std::vector<config::Param>& params, std::vector<std::string>& out) {
  for (const config::Param& p : params) {
    std::string token;
    if (serializeParam(p.key, p.value, token) != Status::OK) { // neither key nor value
      continue;
    }
    out.push_back(std::move(token));
  }
}

Status buildKernelParams(const config::HypervisorConfig& config, std::vector<std::string>& out) {
  std::vector<std::string> tokens;
  tokens.reserve(BASE_KERNEL_PARAMS.size() + DEBUG_KERNEL_PARAMS.size() +
                 config.kernelParams.size());

  Status st = appendBlock(BASE_KERNEL_PARAMS, tokens);
  if (st != Status::OK) {
    return st;
  }

  st = config.debug ? appendBlock(DEBUG_KERNEL_PARAMS, tokens)
                    : appendBlock(QUIET_KERNEL_PARAMS, tokens);
  if (st != Status::OK) {
    return st;
  }

  serializeParams(config.kernelParams, tokens);

  out = std::move(tokens);
  return Status::OK;
}

std::string joinKernelParams(const std::vector<std::string>& tokens) {
  return hvdriver::helpers::strings::join(tokens, " ");
}

} // namespace kernel

} // namespace hvdriver
