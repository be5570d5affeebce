/**
 * @file PodStorage.cpp
 * @brief Filesystem-backed pod state storage.
 */

#include "src/storage/inc/PodStorage.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Log.hpp"

#include <utility> // std::move

namespace hvdriver {

namespace storage {

namespace files = hvdriver::helpers::files;
namespace log = hvdriver::helpers::log;

/* ----------------------------- Paths ----------------------------- */

std::string podDirectory(std::string_view root, std::string_view podId) {
  return files::joinPath(root, podId);
}

std::string consolePath(std::string_view root, std::string_view podId) {
  return files::joinPath(podDirectory(root, podId), DEFAULT_CONSOLE);
}

std::string monitorPath(std::string_view root, std::string_view podId) {
  return files::joinPath(podDirectory(root, podId), MONITOR_SOCKET);
}

std::string statePath(std::string_view root, std::string_view podId) {
  return files::joinPath(podDirectory(root, podId), HYPERVISOR_STATE_FILE);
}

/* ----------------------------- FilesystemStorage ----------------------------- */

FilesystemStorage::FilesystemStorage(std::string root) : root_(std::move(root)) {}

Status FilesystemStorage::fetchHypervisorState(const std::string& podId, HypervisorState& state,
                                               bool& found) {
  const std::string PATH = statePath(root_, podId);

  if (!files::pathExists(PATH.c_str())) {
    found = false;
    return Status::OK;
  }

  std::string text;
  if (!files::readFileToString(PATH, text)) {
    log::error("cannot read {}", PATH);
    return Status::IO_ERROR;
  }

  const Status ST = parseState(text, state);
  if (ST != Status::OK) {
    log::error("{}: {}", PATH, toString(ST));
    return ST;
  }

  found = true;
  return Status::OK;
}

Status FilesystemStorage::storeHypervisorState(const std::string& podId,
                                               const HypervisorState& state) {
  const std::string POD_DIR = podDirectory(root_, podId);
  if (!files::isDirectory(POD_DIR.c_str())) {
    log::error("pod directory {} does not exist", POD_DIR);
    return Status::IO_ERROR;
  }

  const std::string PATH = statePath(root_, podId);
  if (!files::writeFileAtomic(PATH, serializeState(state))) {
    log::error("cannot write {}", PATH);
    return Status::IO_ERROR;
  }

  log::debug("stored hypervisor state for pod {} in {}", podId, PATH);
  return Status::OK;
}

} // namespace storage

} // namespace hvdriver
