#ifndef AWGCHECK_HELPERS_ARGS_HPP
#define AWGCHECK_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI flag parsing for awgcheck tools.
 *
 * Fixed-arity flag parser: a matched flag consumes the next nargs tokens as its
 * values. Tokens that are not a known flag are ignored so that wrappers
 * (cron, monitoring hooks) can pass extra arguments without breaking the tool.
 */

#include <algorithm>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace awgcheck {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;      ///< Flag string, e.g. "--root"
  std::uint8_t nargs;         ///< Number of values required after the flag
  bool required;              ///< True if flag must be provided
  std::string_view desc{};    ///< Description for help output
  std::string_view valueName{}; ///< Placeholder shown in help (defaults to "value")
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * @param args   Argument list (non-owning views; must outlive pargs).
 * @param map    Accepted flags.
 * @param pargs  Output map of parsed values. A repeated flag keeps its last values.
 * @param error  Set to a human-readable message on failure.
 * @return true on success; false if a flag lacks values or a required flag is missing.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, std::string& error) {
  const std::size_t N = args.size();

  for (std::size_t i = 0; i < N; ++i) {
    const auto IT = std::find_if(map.begin(), map.end(),
                                 [&](const auto& KV) { return KV.second.flag == args[i]; });
    if (IT == map.end()) {
      continue;
    }

    const std::uint8_t KEY = IT->first;
    const ArgDef& DEF = IT->second;

    if (N - i - 1 < DEF.nargs) {
      error = fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs);
      return false;
    }

    std::vector<std::string_view>& values = pargs[KEY];
    values.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
                  args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && pargs.count(KV.first) == 0) {
      error = fmt::format("Missing required flag '{}'", KV.second.flag);
      return false;
    }
  }

  return true;
}

/**
 * @brief Print usage information generated from the argument map.
 * @param progName    Program name (typically argv[0]).
 * @param description Tool description.
 * @param map         Argument definitions to document.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);

  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }

  std::vector<std::pair<std::string, const ArgDef*>> rows;
  rows.reserve(map.size());
  std::size_t width = 16;
  for (const auto& KV : map) {
    std::string label(KV.second.flag);
    const std::string_view VALUE =
        KV.second.valueName.empty() ? std::string_view("value") : KV.second.valueName;
    for (std::uint8_t k = 0; k < KV.second.nargs; ++k) {
      label += fmt::format(" <{}>", VALUE);
    }
    width = std::max(width, label.size());
    rows.emplace_back(std::move(label), &KV.second);
  }
  std::sort(rows.begin(), rows.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  fmt::print("Options:\n");
  for (const auto& ROW : rows) {
    fmt::print("  {:<{}}  {}{}\n", ROW.first, width, ROW.second->desc,
               ROW.second->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace awgcheck

#endif // AWGCHECK_HELPERS_ARGS_HPP
