/**
 * @file HostInfo.cpp
 * @brief procfs-backed host facts.
 */

#include "src/resources/inc/HostInfo.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cerrno>  // errno, ERANGE
#include <cstdlib> // strtoull
#include <cstring> // strchr
#include <utility> // std::move

namespace hvdriver {

namespace resources {

using hvdriver::helpers::files::readFileToString;
using hvdriver::helpers::strings::containsWord;
using hvdriver::helpers::strings::skipWhitespace;
using hvdriver::helpers::strings::startsWith;

/* ----------------------------- Parsing ----------------------------- */

Status parseMemTotalKb(const char* text, std::uint64_t& kb) noexcept {
  if (text == nullptr) {
    return Status::CONFIG_ERROR;
  }

  const char* ptr = text;
  while (*ptr != '\0') {
    const char* eol = ptr;
    while (*eol != '\0' && *eol != '\n') {
      ++eol;
    }

    if (startsWith(ptr, "MemTotal:")) {
      const char* num = skipWhitespace(std::strchr(ptr, ':') + 1);
      if (*num < '0' || *num > '9') {
        return Status::CONFIG_ERROR;
      }
      char* end = nullptr;
      errno = 0;
      const unsigned long long VALUE = std::strtoull(num, &end, 10);
      if (errno == ERANGE || end == num || end > eol || VALUE == 0) {
        return Status::CONFIG_ERROR;
      }
      kb = static_cast<std::uint64_t>(VALUE);
      return Status::OK;
    }

    ptr = (*eol == '\0') ? eol : eol + 1;
  }

  return Status::CONFIG_ERROR;
}

bool hasHypervisorFlag(const char* text) noexcept {
  if (text == nullptr) {
    return false;
  }

  const char* ptr = text;
  while (*ptr != '\0') {
    const char* eol = ptr;
    while (*eol != '\0' && *eol != '\n') {
      ++eol;
    }

    // x86 reports "flags", arm64 "Features"
    if (startsWith(ptr, "flags") || startsWith(ptr, "Features")) {
      const char* colon = ptr;
      while (colon < eol && *colon != ':') {
        ++colon;
      }
      if (colon < eol && containsWord(colon + 1, eol, "hypervisor")) {
        return true;
      }
    }

    ptr = (*eol == '\0') ? eol : eol + 1;
  }

  return false;
}

/* ----------------------------- ProcHostInfo ----------------------------- */

ProcHostInfo::ProcHostInfo(std::string memInfoPath, std::string cpuInfoPath)
    : memInfoPath_(std::move(memInfoPath)), cpuInfoPath_(std::move(cpuInfoPath)) {}

Status ProcHostInfo::totalPhysicalMemoryKb(std::uint64_t& kb) const {
  std::string text;
  if (!readFileToString(memInfoPath_, text)) {
    return Status::IO_ERROR;
  }
  return parseMemTotalKb(text.c_str(), kb);
}

Status ProcHostInfo::runningOnVmm(bool& nested) const {
  std::string text;
  if (!readFileToString(cpuInfoPath_, text)) {
    return Status::IO_ERROR;
  }
  nested = hasHypervisorFlag(text.c_str());
  return Status::OK;
}

} // namespace resources

} // namespace hvdriver
