#ifndef KINDLING_HELPERS_ARGS_HPP
#define KINDLING_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Fixed-arity flag parsing for the kindling command line tools. Accepts both
 * "--flag value" and "--flag=value" spellings for single-value flags.
 */

#include <algorithm>
#include <bitset>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <fmt/core.h>

namespace kindling {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--namespace"
  std::uint8_t nargs;      ///< Number of values required after the flag (0 or 1)
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
 * Unknown tokens are rejected so that typos in flag names surface instead of
 * silently falling back to defaults.
 *
 * @param args   Argument list (non-owning views; must outlive the call).
 * @param map    Definitions of accepted flags and their requirements.
 * @param pargs  Output map of parsed values (entries are overwritten per key).
 * @param error  Set to a human-readable message on failure.
 * @return true on success.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, std::string& error) {
  std::unordered_map<std::string_view, std::uint8_t> lut;
  lut.reserve(map.size());
  for (const auto& KV : map) {
    lut.emplace(KV.second.flag, KV.first);
  }

  std::bitset<256> seen;
  const std::size_t N = args.size();

  for (std::size_t i = 0; i < N; ++i) {
    std::string_view tok = args[i];
    std::optional<std::string_view> inlineValue;

    const std::size_t EQ = tok.find('=');
    if (tok.starts_with("--") && EQ != std::string_view::npos) {
      inlineValue = tok.substr(EQ + 1);
      tok = tok.substr(0, EQ);
    }

    auto it = lut.find(tok);
    if (it == lut.end()) {
      error = fmt::format("Unknown argument '{}'", args[i]);
      return false;
    }

    const std::uint8_t KEY = it->second;
    const ArgDef& DEF = map.at(KEY);
    auto& out = pargs[KEY];
    out.clear();

    if (inlineValue) {
      if (DEF.nargs != 1) {
        error = fmt::format("Flag '{}' does not take an inline value", DEF.flag);
        return false;
      }
      out.push_back(*inlineValue);
    } else {
      if (DEF.nargs > 0 && i + DEF.nargs >= N) {
        error = fmt::format("Argument out of bounds: expected {} values for flag '{}'", DEF.nargs,
                            DEF.flag);
        return false;
      }
      for (std::uint8_t k = 0; k < DEF.nargs; ++k) {
        out.push_back(args[i + 1 + k]);
      }
      i += DEF.nargs;
    }

    seen.set(KEY);
  }

  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      error = fmt::format("Missing required argument '{}'", KV.second.flag);
      return false;
    }
  }

  return true;
}

/// True when the flag was given on the command line.
[[nodiscard]] inline bool hasFlag(const ParsedArgs& pargs, std::uint8_t key) noexcept {
  return pargs.count(key) != 0;
}

/// First value of a single-value flag, if present.
[[nodiscard]] inline std::optional<std::string_view> flagValue(const ParsedArgs& pargs,
                                                               std::uint8_t key) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::nullopt;
  }
  return IT->second.front();
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

  std::vector<const ArgDef*> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.push_back(&KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  std::size_t width = 16;
  for (const ArgDef* def : entries) {
    const std::size_t W = def->flag.size() + (def->nargs > 0 ? 8 : 0);
    width = std::max(width, W);
  }
  width = std::min<std::size_t>(width, 30);

  for (const ArgDef* def : entries) {
    std::string flagStr(def->flag);
    if (def->nargs > 0) {
      flagStr.append(" <value>");
    }
    fmt::print("  {:<{}}  {}{}\n", flagStr, width, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace kindling

#endif // KINDLING_HELPERS_ARGS_HPP
