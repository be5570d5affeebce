/**
 * @file QemuParams.cpp
 * @brief QEMU option grammar for devices and VM sections.
 */

#include "src/qemu/inc/QemuParams.hpp"

#include <utility> // std::move

#include <fmt/core.h>

namespace hvdriver {

namespace qemu {

namespace {

/* ----------------------------- Device Helpers ----------------------------- */

/// ",disable-modern=true" when set, empty otherwise.
const char* modernSuffix(bool disableModern) noexcept {
  return disableModern ? ",disable-modern=true" : "";
}

void push(std::vector<std::string>& out, const char* opt, std::string value) {
  out.emplace_back(opt);
  out.push_back(std::move(value));
}

void render(std::vector<std::string>& out, const FsDevice& dev) {
  push(out, "-fsdev",
       fmt::format("{},id={},path={},security_model={}", toString(dev.fsDriver), dev.id, dev.path,
                   toString(dev.securityModel)));
  push(out, "-device",
       fmt::format("{}{},fsdev={},mount_tag={}", toString(dev.driver),
                   modernSuffix(dev.disableModern), dev.id, dev.mountTag));
}

void render(std::vector<std::string>& out, const CharDevice& dev) {
  push(out, "-chardev",
       fmt::format("{},id={},path={},server,nowait", toString(dev.backend), dev.id, dev.path));

  std::string front = fmt::format("{},chardev={},id={}", toString(dev.driver), dev.id, dev.deviceId);
  if (!dev.name.empty()) {
    front += fmt::format(",name={}", dev.name);
  }
  push(out, "-device", std::move(front));
}

void render(std::vector<std::string>& out, const SerialDevice& dev) {
  push(out, "-device",
       fmt::format("{}{},id={}", toString(dev.driver), modernSuffix(dev.disableModern), dev.id));
}

void render(std::vector<std::string>& out, const BlockDevice& dev) {
  push(out, "-drive",
       fmt::format("id={},file={},aio={},format={},if={}", dev.id, dev.file, toString(dev.aio),
                   dev.format, dev.interface));
  push(out, "-device",
       fmt::format("{}{},drive={},scsi=off,config-wce=off", toString(dev.driver),
                   modernSuffix(dev.disableModern), dev.id));
}

void render(std::vector<std::string>& out, const VfioDevice& dev) {
  push(out, "-device", fmt::format("{},host={}", toString(DeviceDriver::VFIO), dev.bdf));
}

void render(std::vector<std::string>& out, const VhostUserDevice& dev) {
  push(out, "-chardev", fmt::format("socket,id={},path={}", dev.charDevId, dev.socketPath));
  push(out, "-netdev",
       fmt::format("type=vhost-user,id={},chardev={},vhostforce", dev.typeDevId, dev.charDevId));
  push(out, "-device",
       fmt::format("{},netdev={},mac={}", toString(dev.vhostUserType), dev.typeDevId,
                   dev.address));
}

void render(std::vector<std::string>& out, const MemoryObject& dev) {
  push(out, "-object",
       fmt::format("{},id={},mem-path={},size={}", toString(dev.type), dev.id, dev.memPath,
                   dev.size));
  push(out, "-device", fmt::format("{},id={},memdev={}", toString(dev.driver), dev.deviceId, dev.id));
}

} // namespace

/* ----------------------------- API ----------------------------- */

std::vector<std::string> toQemuParams(const Device& device) {
  std::vector<std::string> out;
  std::visit([&out](const auto& dev) { render(out, dev); }, device);
  return out;
}

std::vector<std::string> toQemuParams(const QemuConfig& config) {
  std::vector<std::string> out;

  if (!config.name.empty()) {
    push(out, "-name", config.name);
  }
  if (!config.machine.type.empty()) {
    std::string machine = config.machine.type;
    if (!config.machine.acceleration.empty()) {
      machine += fmt::format(",accel={}", config.machine.acceleration);
    }
    push(out, "-machine", std::move(machine));
  }
  if (!config.cpuModel.empty()) {
    push(out, "-cpu", config.cpuModel);
  }
  if (!config.qmpSocketPath.empty()) {
    push(out, "-qmp", fmt::format("unix:{},server,nowait", config.qmpSocketPath));
  }
  if (config.smp.cpus > 0) {
    push(out, "-smp",
         fmt::format("{},cores={},sockets={},threads={}", config.smp.cpus, config.smp.cores,
                     config.smp.sockets, config.smp.threads));
  }
  if (!config.memory.size.empty()) {
    std::string memory = config.memory.size;
    if (config.memory.slots > 0 && !config.memory.maxMem.empty()) {
      memory += fmt::format(",slots={},maxmem={}", config.memory.slots, config.memory.maxMem);
    }
    push(out, "-m", std::move(memory));
  }
  if (!config.rtc.base.empty()) {
    push(out, "-rtc", fmt::format("base={},driftfix={}", config.rtc.base, config.rtc.driftFix));
  }

  for (const Device& DEV : config.devices) {
    std::vector<std::string> params = toQemuParams(DEV);
    out.insert(out.end(), params.begin(), params.end());
  }

  if (!config.kernel.path.empty()) {
    push(out, "-kernel", config.kernel.path);
    if (!config.kernel.params.empty()) {
      push(out, "-append", config.kernel.params);
    }
  }

  if (config.knobs.noUserConfig) {
    out.emplace_back("-no-user-config");
  }
  if (config.knobs.noDefaults) {
    out.emplace_back("-nodefaults");
  }
  if (config.knobs.noGraphic) {
    out.emplace_back("-nographic");
  }
  if (config.knobs.daemonize) {
    out.emplace_back("-daemonize");
  }

  return out;
}

} // namespace qemu

} // namespace hvdriver
