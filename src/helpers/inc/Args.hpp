#ifndef HVDRIVER_HELPERS_ARGS_HPP
#define HVDRIVER_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Fixed-arity CLI argument parsing for the diagnostic tools.
 *
 * @note Cold path: allocates for the parsed result and error strings.
 */

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace hvdriver {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--pod"
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output (optional)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * A matched flag consumes the next nargs tokens literally. Tokens that match
 * no flag are rejected, so a mistyped option never goes unnoticed.
 *
 * @param args   Argument list (non-owning views; must outlive pargs).
 * @param map    Definitions of accepted flags and their requirements.
 * @param pargs  Output map of parsed values (entries are overwritten per key).
 * @param error  Optional error message target (set on failure when provided).
 * @return true on success; false on error.
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) {
  auto fail = [&error](std::string msg) {
    if (error) {
      error->get() = std::move(msg);
    }
    return false;
  };

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view TOK = args[i];
    const auto IT = std::find_if(map.begin(), map.end(),
                                 [TOK](const auto& KV) { return KV.second.flag == TOK; });
    if (IT == map.end()) {
      return fail(fmt::format("Unknown argument '{}'", TOK));
    }

    const ArgDef& DEF = IT->second;
    if (i + DEF.nargs >= args.size()) {
      return fail(fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs));
    }

    std::vector<std::string_view>& out = pargs[IT->first];
    out.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
               args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && pargs.count(KV.first) == 0) {
      return fail(fmt::format("Missing required argument '{}'", KV.second.flag));
    }
  }

  return true;
}

/**
 * @brief First value given for a flag, or a fallback when absent.
 */
[[nodiscard]] inline std::string_view firstValue(const ParsedArgs& pargs, std::uint8_t key,
                                                 std::string_view fallback = {}) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return fallback;
  }
  return IT->second.front();
}

/**
 * @brief Parse an unsigned decimal value.
 * @return false if the text is empty or has trailing garbage.
 */
[[nodiscard]] inline bool parseUint(std::string_view text, std::uint64_t& out) {
  if (text.empty()) {
    return false;
  }
  const std::string BUF(text);
  char* end = nullptr;
  const unsigned long long VAL = std::strtoull(BUF.c_str(), &end, 10);
  if (end == BUF.c_str() || *end != '\0' || BUF.front() == '-') {
    return false;
  }
  out = static_cast<std::uint64_t>(VAL);
  return true;
}

/**
 * @brief Print usage information for a CLI tool.
 * @param progName    Program name (typically argv[0]).
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<const ArgDef*> defs;
  defs.reserve(map.size());
  for (const auto& KV : map) {
    defs.push_back(&KV.second);
  }
  std::sort(defs.begin(), defs.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : defs) {
    const std::string FLAG =
        (def->nargs > 0) ? fmt::format("{} <value>", def->flag) : std::string(def->flag);
    fmt::print("  {:<22}  {}{}\n", FLAG, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace hvdriver

#endif // HVDRIVER_HELPERS_ARGS_HPP
