/**
 * @file Qemu.cpp
 * @brief QEMU driver lifecycle.
 */

#include "src/hypervisor/inc/Qemu.hpp"
#include "src/annotations/inc/Annotations.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/kernel/inc/KernelParams.hpp"
#include "src/resources/inc/Resources.hpp"

#include <string_view> // std::string_view
#include <utility>     // std::move

#include <fmt/core.h>

namespace hvdriver {

namespace hypervisor {

namespace log = hvdriver::helpers::log;

namespace {

/// Machine type to boot; an unset type selects the default board.
std::string_view machineTypeOrDefault(const std::string& type) noexcept {
  return type.empty() ? machine::DEFAULT_MACHINE_TYPE : std::string_view(type);
}

} // namespace

/* ----------------------------- Construction ----------------------------- */

Qemu::Qemu(storage::PodStorage& storage, const resources::HostInfo& host) noexcept
    : storage_(storage), host_(host) {}

/* ----------------------------- init ----------------------------- */

Status Qemu::init(const std::string& podId, const config::HypervisorConfig& config) {
  config::HypervisorConfig cfg = config;
  Status st = cfg.valid();
  if (st != Status::OK) {
    log::error("pod {}: invalid hypervisor configuration (kernel '{}', image '{}')", podId,
               cfg.kernelPath, cfg.imagePath);
    return st;
  }

  bool nested = false;
  st = host_.runningOnVmm(nested);
  if (st != Status::OK) {
    log::error("pod {}: cannot detect nested virtualization: {}", podId, toString(st));
    return st;
  }

  storage::HypervisorState state{};
  bool found = false;
  st = storage_.fetchHypervisorState(podId, state, found);
  if (st != Status::OK) {
    log::error("pod {}: cannot load hypervisor state: {}", podId, toString(st));
    return st;
  }

  qemu::Machine board{};

  if (found) {
    log::debug("pod {}: restoring hypervisor state", podId);
    const std::string_view TYPE = machineTypeOrDefault(state.config.machineType);
    st = machine::getMachine(TYPE, board);
    if (st != Status::OK) {
      log::error("pod {}: persisted machine type '{}' is not supported", podId, TYPE);
      return st;
    }
  } else {
    log::debug("pod {}: no persisted state, building fresh configuration", podId);
    const std::string_view TYPE = machineTypeOrDefault(cfg.machineType);
    st = machine::getMachine(TYPE, board);
    if (st != Status::OK) {
      log::error("pod {}: unsupported machine type '{}'", podId, TYPE);
      return st;
    }

    state.version = storage::STATE_SCHEMA_VERSION;
    state.hypervisorPath = cfg.hypervisorPath.empty()
                               ? std::string(machine::findMachine(board.type)->defaultPath)
                               : cfg.hypervisorPath;

    st = kernel::buildKernelParams(cfg, state.kernelParams);
    if (st != Status::OK) {
      log::error("pod {}: cannot build kernel parameters: {}", podId, toString(st));
      return st;
    }

    state.config = std::move(cfg);
    st = storage_.storeHypervisorState(podId, state);
    if (st != Status::OK) {
      log::error("pod {}: cannot persist hypervisor state: {}", podId, toString(st));
      return st;
    }
  }

  qemu::QemuConfig qc{};
  qc.path = state.hypervisorPath;
  qc.machine = std::move(board);
  qc.nestedRun = nested;

  podId_ = podId;
  config_ = std::move(state.config);
  path_ = std::move(state.hypervisorPath);
  kernelParams_ = std::move(state.kernelParams);
  qemuConfig_ = std::move(qc);
  initialized_ = true;

  log::info("pod {}: hypervisor {} machine {}{}", podId_, path_, qemuConfig_.machine.type,
            nested ? " (nested)" : "");
  return Status::OK;
}

Status Qemu::init(const pod::PodConfig& podConfig) {
  config::HypervisorConfig cfg = podConfig.hypervisorConfig;
  const Status ST = annotations::applyAssetAnnotations(podConfig.annotations, cfg);
  if (ST != Status::OK) {
    log::error("pod {}: invalid asset annotations", podConfig.id);
    return ST;
  }
  return init(podConfig.id, cfg);
}

/* ----------------------------- Queries ----------------------------- */

std::string Qemu::getPodConsole(const std::string& podId) const {
  return storage::consolePath(storage_.runStoragePath(), podId);
}

machine::Capabilities Qemu::capabilities() const noexcept {
  return machine::capabilitiesFor(qemuConfig_.machine.type);
}

/* ----------------------------- createPod ----------------------------- */

Status Qemu::createPod(const pod::PodConfig& podConfig) {
  if (!initialized_) {
    log::error("pod {}: createPod before init", podConfig.id);
    return Status::CONFIG_ERROR;
  }
  if (podConfig.id != podId_) {
    log::error("pod {}: driver is bound to pod {}", podConfig.id, podId_);
    return Status::CONFIG_ERROR;
  }

  pod::Resources request = podConfig.vmConfig;
  if (request.vcpus == 0) {
    request.vcpus = config_.defaultVcpus;
  }
  if (request.memoryMiB == 0) {
    request.memoryMiB = config_.defaultMemSzMiB;
  }

  qemu::QemuConfig qc{};
  qc.name = fmt::format("{}{}", POD_NAME_PREFIX, podId_);
  qc.path = path_;
  qc.machine = qemuConfig_.machine;
  qc.nestedRun = qemuConfig_.nestedRun;
  qc.smp = resources::setCpuResources(request);

  Status st = resources::setMemoryResources(request, host_, qc.memory);
  if (st != Status::OK) {
    log::error("pod {}: cannot size guest memory: {}", podId_, toString(st));
    return st;
  }

  qc.kernel.path = config_.kernelPath;
  qc.kernel.params = kernel::joinKernelParams(kernelParams_);
  qc.qmpSocketPath = storage::monitorPath(storage_.runStoragePath(), podId_);
  qc.cpuModel = std::string(qc.nestedRun ? CPU_MODEL_NESTED : CPU_MODEL);
  qc.knobs = qemu::Knobs{true, true, true, true};
  qc.rtc = qemu::Rtc{std::string(RTC_BASE), std::string(RTC_DRIFT_FIX)};

  device::appendFsDevices(qc, podConfig);
  device::appendConsoles(qc, getPodConsole(podId_));
  st = device::appendImage(qc, config_.imagePath);
  if (st != Status::OK) {
    return st;
  }

  qemuConfig_ = std::move(qc);
  log::debug("pod {}: {} vCPUs, {} memory, {} devices", podId_, qemuConfig_.smp.cpus,
             qemuConfig_.memory.size, qemuConfig_.devices.size());
  return Status::OK;
}

/* ----------------------------- addDevice ----------------------------- */

Status Qemu::addDevice(const device::DeviceInfo& info, device::DeviceType type) {
  return device::addDevice(qemuConfig_, type, info);
}

} // namespace hypervisor

} // namespace hvdriver
