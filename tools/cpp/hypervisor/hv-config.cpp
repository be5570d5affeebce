/**
 * @file hv-config.cpp
 * @brief Dry-run the QEMU driver for one pod and print the resulting VM.
 *
 * Initializes the driver against the run storage (restoring or persisting
 * the pod's hypervisor state), builds the boot configuration and prints the
 * kernel command line, guest sizing, device list and the final QEMU
 * argument vector. Nothing is launched.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/hypervisor/inc/Qemu.hpp"
#include "src/qemu/inc/QemuParams.hpp"

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <json/json.h>

namespace args = hvdriver::helpers::args;
namespace hvlog = hvdriver::helpers::log;
namespace hv = hvdriver::hypervisor;

using hvdriver::Status;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_POD = 1,
  ARG_KERNEL = 2,
  ARG_IMAGE = 3,
  ARG_MACHINE = 4,
  ARG_QEMU = 5,
  ARG_VCPUS = 6,
  ARG_MEMORY = 7,
  ARG_VOLUME = 8,
  ARG_ROOT = 9,
  ARG_DEBUG = 10,
  ARG_VERBOSE = 11,
  ARG_JSON = 12,
};

constexpr std::string_view DESCRIPTION =
    "Build the QEMU boot configuration of a pod without launching it.";

args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_POD] = {"--pod", 1, true, "Pod identifier"};
  map[ARG_KERNEL] = {"--kernel", 1, true, "Guest kernel path"};
  map[ARG_IMAGE] = {"--image", 1, true, "Guest root image path"};
  map[ARG_MACHINE] = {"--machine", 1, false, "Machine type (default: pc-lite)"};
  map[ARG_QEMU] = {"--qemu", 1, false, "Hypervisor binary (default: per machine type)"};
  map[ARG_VCPUS] = {"--vcpus", 1, false, "Guest vCPUs (default: 1)"};
  map[ARG_MEMORY] = {"--memory", 1, false, "Guest memory in MiB (default: 2048)"};
  map[ARG_VOLUME] = {"--volume", 2, false, "Share a host directory: <mount-tag> <host-path>"};
  map[ARG_ROOT] = {"--root", 1, false, "Run storage root (default: /run/virtcontainers/pods)"};
  map[ARG_DEBUG] = {"--debug", 0, false, "Verbose guest kernel console"};
  map[ARG_VERBOSE] = {"--verbose", 0, false, "Log driver activity to stderr"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  return map;
}

/// Parse an optional unsigned flag; absent flags keep @p out unchanged.
bool optionalUint(const args::ParsedArgs& pargs, std::uint8_t key, std::string_view flag,
                  std::uint32_t& out) {
  const std::string_view TEXT = args::firstValue(pargs, key);
  if (TEXT.empty()) {
    return true;
  }
  std::uint64_t value = 0;
  if (!args::parseUint(TEXT, value) || value > UINT32_MAX) {
    fmt::print(stderr, "Error: invalid value '{}' for {}\n", TEXT, flag);
    return false;
  }
  out = static_cast<std::uint32_t>(value);
  return true;
}

/* ----------------------------- Human Output ----------------------------- */

void printHuman(const hv::Qemu& q, std::uint64_t hostMemKb) {
  const hvdriver::qemu::QemuConfig& QC = q.qemuConfig();

  fmt::print("Pod:            {}\n", q.podId());
  fmt::print("Hypervisor:     {}\n", q.path());
  fmt::print("Machine:        {} ({})\n", QC.machine.type, QC.machine.acceleration);
  fmt::print("Nested run:     {}\n", q.nestedRun() ? "yes" : "no");
  fmt::print("Block hotplug:  {}\n",
             q.capabilities().isBlockDeviceHotplugSupported() ? "supported" : "unsupported");

  fmt::print("\nSizing:\n");
  fmt::print("  vCPUs:        {}\n", QC.smp.cpus);
  fmt::print("  Memory:       {} ({} slots, max {})\n", QC.memory.size, QC.memory.slots,
             QC.memory.maxMem);
  if (hostMemKb > 0) {
    fmt::print("  Host memory:  {}\n", hvdriver::helpers::format::bytesBinary(hostMemKb * 1024));
  }

  fmt::print("\nKernel:\n");
  fmt::print("  Path:         {}\n", QC.kernel.path);
  fmt::print("  Params:       {}\n", QC.kernel.params);

  fmt::print("\nDevices ({}):\n", QC.devices.size());
  for (const hvdriver::qemu::Device& DEV : QC.devices) {
    fmt::print("  {:<18} {}\n", hvdriver::qemu::kindOf(DEV), hvdriver::qemu::deviceId(DEV));
  }

  fmt::print("\nCommand line:\n  {}", QC.path);
  for (const std::string& ARG : hvdriver::qemu::toQemuParams(QC)) {
    fmt::print(" {}", ARG);
  }
  fmt::print("\n");
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const hv::Qemu& q, std::uint64_t hostMemKb) {
  const hvdriver::qemu::QemuConfig& QC = q.qemuConfig();

  Json::Value root(Json::objectValue);
  root["pod"] = q.podId();
  root["hypervisor"] = q.path();
  root["machine"] = QC.machine.type;
  root["nestedRun"] = q.nestedRun();
  root["blockDeviceHotplug"] = q.capabilities().isBlockDeviceHotplugSupported();
  root["vcpus"] = QC.smp.cpus;
  root["memory"] = QC.memory.size;
  root["maxMemory"] = QC.memory.maxMem;
  root["hostMemoryKb"] = static_cast<Json::UInt64>(hostMemKb);
  root["kernel"] = QC.kernel.path;

  Json::Value params(Json::arrayValue);
  for (const std::string& P : q.kernelParams()) {
    params.append(P);
  }
  root["kernelParams"] = params;

  Json::Value devices(Json::arrayValue);
  for (const hvdriver::qemu::Device& DEV : QC.devices) {
    Json::Value entry(Json::objectValue);
    entry["kind"] = hvdriver::qemu::kindOf(DEV);
    entry["id"] = hvdriver::qemu::deviceId(DEV);
    devices.append(entry);
  }
  root["devices"] = devices;

  Json::Value argv(Json::arrayValue);
  argv.append(QC.path);
  for (const std::string& ARG : hvdriver::qemu::toQemuParams(QC)) {
    argv.append(ARG);
  }
  root["argv"] = argv;

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  fmt::print("{}\n", Json::writeString(builder, root));
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  // --help wins over missing required flags
  for (const std::string_view A : argList) {
    if (A == "--help") {
      args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 0;
    }
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }

  const bool JSON_OUTPUT = (pargs.count(ARG_JSON) != 0);
  hvlog::init(pargs.count(ARG_VERBOSE) != 0 ? hvlog::Level::DEBUG : hvlog::Level::ERROR);

  hvdriver::pod::PodConfig podConfig{};
  podConfig.id = std::string(args::firstValue(pargs, ARG_POD));

  hvdriver::config::HypervisorConfig& hvConfig = podConfig.hypervisorConfig;
  hvConfig.kernelPath = std::string(args::firstValue(pargs, ARG_KERNEL));
  hvConfig.imagePath = std::string(args::firstValue(pargs, ARG_IMAGE));
  hvConfig.machineType = std::string(args::firstValue(pargs, ARG_MACHINE));
  hvConfig.hypervisorPath = std::string(args::firstValue(pargs, ARG_QEMU));
  hvConfig.debug = (pargs.count(ARG_DEBUG) != 0);

  if (!optionalUint(pargs, ARG_VCPUS, "--vcpus", podConfig.vmConfig.vcpus) ||
      !optionalUint(pargs, ARG_MEMORY, "--memory", podConfig.vmConfig.memoryMiB)) {
    return 1;
  }

  // Fixed arity keeps only the last --volume pair
  const auto VOL = pargs.find(ARG_VOLUME);
  if (VOL != pargs.end() && VOL->second.size() == 2) {
    podConfig.volumes.push_back(
        hvdriver::pod::Volume{std::string(VOL->second[0]), std::string(VOL->second[1])});
  }

  hvdriver::storage::FilesystemStorage storage(std::string(
      args::firstValue(pargs, ARG_ROOT, hvdriver::storage::DEFAULT_RUN_STORAGE_PATH)));
  const hvdriver::resources::ProcHostInfo HOST;
  hv::Qemu q(storage, HOST);

  Status st = q.init(podConfig);
  if (st != Status::OK) {
    fmt::print(stderr, "Error: driver init failed: {}\n", hvdriver::toString(st));
    return 1;
  }

  st = q.createPod(podConfig);
  if (st != Status::OK) {
    fmt::print(stderr, "Error: boot configuration failed: {}\n", hvdriver::toString(st));
    return 1;
  }

  std::uint64_t hostMemKb = 0;
  if (HOST.totalPhysicalMemoryKb(hostMemKb) != Status::OK) {
    hostMemKb = 0;
  }

  if (JSON_OUTPUT) {
    printJson(q, hostMemKb);
  } else {
    printHuman(q, hostMemKb);
  }

  return 0;
}
