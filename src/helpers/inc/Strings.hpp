#ifndef HVDRIVER_HELPERS_STRINGS_HPP
#define HVDRIVER_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for host-info parsing and command-line assembly.
 *
 * The pointer-based helpers work on null-terminated buffers and never
 * allocate. The std::string helpers are for cold paths only.
 */

#include <cstddef>
#include <cstring> // strlen, strncmp
#include <string>
#include <vector>

namespace hvdriver {
namespace helpers {
namespace strings {

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Skip leading whitespace (spaces and tabs).
 * @param ptr Pointer into string.
 * @return Pointer to first non-whitespace character (or end of string).
 */
[[nodiscard]] inline const char* skipWhitespace(const char* ptr) noexcept {
  if (ptr == nullptr) {
    return nullptr;
  }
  while (*ptr == ' ' || *ptr == '\t') {
    ++ptr;
  }
  return ptr;
}

/**
 * @brief Check if string starts with prefix.
 * @param str String to check.
 * @param prefix Prefix to look for.
 * @return true if str starts with prefix.
 */
[[nodiscard]] inline bool startsWith(const char* str, const char* prefix) noexcept {
  if (str == nullptr || prefix == nullptr) {
    return false;
  }
  return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/**
 * @brief Check whether a whitespace-separated word occurs in [begin, end).
 * @param begin First character of the range.
 * @param end One past the last character.
 * @param word Word to look for (exact, case-sensitive).
 */
[[nodiscard]] inline bool containsWord(const char* begin, const char* end,
                                       const char* word) noexcept {
  if (begin == nullptr || end == nullptr || word == nullptr) {
    return false;
  }
  const std::size_t LEN = std::strlen(word);
  const char* ptr = begin;
  while (ptr < end) {
    while (ptr < end && (*ptr == ' ' || *ptr == '\t')) {
      ++ptr;
    }
    const char* wordEnd = ptr;
    while (wordEnd < end && *wordEnd != ' ' && *wordEnd != '\t') {
      ++wordEnd;
    }
    if (static_cast<std::size_t>(wordEnd - ptr) == LEN && std::strncmp(ptr, word, LEN) == 0) {
      return true;
    }
    ptr = wordEnd;
  }
  return false;
}

/**
 * @brief Join tokens with a separator.
 * @note Cold path: allocates.
 */
[[nodiscard]] inline std::string join(const std::vector<std::string>& tokens,
                                      const char* sep = " ") {
  std::string out;
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    if (i > 0) {
      out.append(sep);
    }
    out.append(tokens[i]);
  }
  return out;
}

} // namespace strings
} // namespace helpers
} // namespace hvdriver

#endif // HVDRIVER_HELPERS_STRINGS_HPP
