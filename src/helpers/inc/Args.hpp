#ifndef KEEPER_HELPERS_ARGS_HPP
#define KEEPER_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Fixed-arity flag parsing for the driver-keeper subcommands. Each flag may
 * carry a short alias ("-m" for "--max-threads"). Cold-path only.
 *
 * @note Cold-path: Allocates std::unordered_map for parsed results.
 */

#include <algorithm>
#include <bitset>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <fmt/core.h>

namespace keeper {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;    ///< Long flag string, e.g. "--kernel"
  std::string_view alias{}; ///< Short alias, e.g. "-k" (optional)
  std::uint8_t nargs{0};    ///< Number of values required after the flag
  bool required{false};     ///< True if flag must be provided
  std::string_view desc{};  ///< Description for help output (optional)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * When a flag (or its alias) is matched, the next nargs tokens are consumed
 * literally as its values. In strict mode any token that is not a known flag
 * or a consumed value is an error.
 *
 * @param args   Argument list (non-owning views; must outlive the call).
 * @param map    Definitions of accepted flags and their requirements.
 * @param pargs  Output map of parsed values (entries are overwritten per key).
 * @param strict Reject unknown tokens.
 * @param error  Optional error message target (set on failure when provided).
 * @return true on success; false on error (and sets error if provided).
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          bool strict = true,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) noexcept {
  std::unordered_map<std::string_view, std::uint8_t> lut;
  lut.reserve(map.size() * 2);
  for (const auto& KV : map) {
    lut.emplace(KV.second.flag, KV.first);
    if (!KV.second.alias.empty()) {
      lut.emplace(KV.second.alias, KV.first);
    }
  }

  std::bitset<256> seen;
  const std::size_t N = args.size();

  for (std::size_t i = 0; i < N; ++i) {
    const std::string_view TOK = args[i];
    auto it = lut.find(TOK);
    if (it == lut.end()) {
      if (strict) {
        if (error) {
          error->get() = fmt::format("Unknown argument '{}'", TOK);
        }
        return false;
      }
      continue;
    }

    const std::uint8_t KEY = it->second;
    const ArgDef& DEF = map.at(KEY);

    if (i + static_cast<std::size_t>(DEF.nargs) >= N) {
      if (error) {
        error->get() =
            fmt::format("Argument out of bounds: expected {} values for flag '{}'", DEF.nargs, TOK);
      }
      return false;
    }

    auto& out = pargs[KEY];
    out.clear();
    for (std::uint8_t k = 0; k < DEF.nargs; ++k) {
      out.emplace_back(args[i + 1 + k]);
    }

    seen.set(KEY);
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      if (error) {
        error->get() = fmt::format("Missing required argument '{}'", KV.second.flag);
      }
      return false;
    }
  }

  return true;
}

/**
 * @brief First value parsed for a key, or fallback when absent.
 */
[[nodiscard]] inline std::string_view valueOr(const ParsedArgs& pargs, std::uint8_t key,
                                              std::string_view fallback) noexcept {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return fallback;
  }
  return IT->second.front();
}

/**
 * @brief Print option help for one argument map.
 *
 * @param out    Output stream (stdout for --help, stderr for usage errors).
 * @param map    Argument definitions to document.
 * @param indent Leading spaces for each line.
 */
inline void printOptions(std::FILE* out, const ArgMap& map, std::size_t indent = 2) noexcept {
  std::vector<const ArgDef*> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.push_back(&KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : entries) {
    std::string flagStr;
    if (!def->alias.empty()) {
      flagStr += fmt::format("{}, ", def->alias);
    }
    flagStr.append(def->flag);
    if (def->nargs == 1) {
      flagStr.append(" <value>");
    }

    fmt::print(out, "{:{}}{:<28}  {}{}\n", "", indent, flagStr, def->desc,
               def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace keeper

#endif // KEEPER_HELPERS_ARGS_HPP
