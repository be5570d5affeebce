#ifndef HVDRIVER_HELPERS_FILES_HPP
#define HVDRIVER_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief File I/O and path utilities used by the driver layer.
 *
 * Uses C-style I/O (open/read/write/close) throughout. Host sources (/proc)
 * and state files are read whole into std::string.
 *
 * @note Path checks use stat() and are subject to filesystem/cache latency.
 */

#include <fcntl.h>    // open, O_RDONLY, O_WRONLY, O_CREAT, O_TRUNC
#include <stdio.h>    // rename
#include <sys/stat.h> // stat, fstat, S_ISDIR, S_ISREG
#include <unistd.h>   // read, write, close, fsync, unlink

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace hvdriver {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Chunk size for whole-file reads into std::string.
inline constexpr std::size_t FILE_READ_CHUNK_SIZE = 4096;

/// Permission bits for files written by the driver.
inline constexpr mode_t FILE_MODE = 0640;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read a whole file into a string.
 * @param path File path to read.
 * @param out Receives the file contents (cleared first).
 * @return true if the file was opened and read to EOF.
 */
[[nodiscard]] inline bool readFileToString(const std::string& path, std::string& out) {
  out.clear();

  const int FD = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return false;
  }

  char chunk[FILE_READ_CHUNK_SIZE];
  bool ok = true;
  for (;;) {
    const ssize_t N = ::read(FD, chunk, sizeof(chunk));
    if (N == 0) {
      break;
    }
    if (N < 0) {
      ok = false;
      break;
    }
    out.append(chunk, static_cast<std::size_t>(N));
  }

  ::close(FD);
  return ok;
}

/**
 * @brief Size in bytes of a file, taken from fstat on an open descriptor.
 * @param path File path.
 * @param size Receives the byte length.
 * @return true if the file could be opened and stat'd.
 */
[[nodiscard]] inline bool fileSize(const std::string& path, std::uint64_t& size) noexcept {
  const int FD = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return false;
  }

  struct stat st{};
  const bool OK = ::fstat(FD, &st) == 0;
  ::close(FD);
  if (!OK) {
    return false;
  }

  size = static_cast<std::uint64_t>(st.st_size);
  return true;
}

/* ----------------------------- File Writing ----------------------------- */

/**
 * @brief Replace a file's contents atomically.
 * @param path Final file path. Its directory must already exist.
 * @param data Bytes to write.
 * @return true on success. On failure the previous file (if any) is intact
 *         and no temporary file is left behind.
 *
 * Writes "<path>.tmp", fsyncs it and renames it over @p path.
 */
[[nodiscard]] inline bool writeFileAtomic(const std::string& path, std::string_view data) {
  const std::string TMP = path + ".tmp";

  const int FD = ::open(TMP.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, FILE_MODE);
  if (FD < 0) {
    return false;
  }

  std::size_t written = 0;
  bool ok = true;
  while (written < data.size()) {
    const ssize_t N = ::write(FD, data.data() + written, data.size() - written);
    if (N <= 0) {
      ok = false;
      break;
    }
    written += static_cast<std::size_t>(N);
  }

  if (ok && ::fsync(FD) != 0) {
    ok = false;
  }
  if (::close(FD) != 0) {
    ok = false;
  }

  if (ok && ::rename(TMP.c_str(), path.c_str()) != 0) {
    ok = false;
  }
  if (!ok) {
    ::unlink(TMP.c_str());
  }
  return ok;
}

/* ----------------------------- Path Utilities ----------------------------- */

/**
 * @brief Check if path exists (file or directory).
 * @param path Path to check.
 * @return true if path exists.
 */
[[nodiscard]] inline bool pathExists(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  return ::stat(path, &st) == 0;
}

/**
 * @brief Check if path is a directory.
 * @param path Path to check.
 * @return true if path exists and is a directory.
 */
[[nodiscard]] inline bool isDirectory(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  struct stat st{};
  if (::stat(path, &st) != 0) {
    return false;
  }
  return S_ISDIR(st.st_mode);
}

/**
 * @brief Join two path components with a single '/'.
 * @note Lexical only, no filesystem access.
 */
[[nodiscard]] inline std::string joinPath(std::string_view base, std::string_view name) {
  std::string out(base);
  if (!out.empty() && out.back() != '/' && !name.empty() && name.front() != '/') {
    out.push_back('/');
  } else if (!out.empty() && out.back() == '/' && !name.empty() && name.front() == '/') {
    name.remove_prefix(1);
  }
  out.append(name);
  return out;
}

} // namespace files
} // namespace helpers
} // namespace hvdriver

#endif // HVDRIVER_HELPERS_FILES_HPP
