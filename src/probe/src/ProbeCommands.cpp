/**
 * @file ProbeCommands.cpp
 * @brief Implementation of in-container command builders and output parsers.
 */

#include "src/probe/inc/ProbeCommands.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <limits>

#include <fmt/core.h>

namespace awgcheck {

namespace probe {

using awgcheck::helpers::strings::parseInt64;
using awgcheck::helpers::strings::shellQuote;
using awgcheck::helpers::strings::trim;

namespace {

/// Marker file name used by the writability probe.
constexpr std::string_view WRITE_MARKER = ".wtest";

} // namespace

/* ----------------------------- Commands ----------------------------- */

std::string readableTestCommand(std::string_view path) {
  return fmt::format("test -r {}", shellQuote(path));
}

std::string writeProbeCommand(std::string_view dir) {
  std::string marker(dir);
  if (marker.empty() || marker.back() != '/') {
    marker.push_back('/');
  }
  marker.append(WRITE_MARKER);
  return fmt::format("p={}; rc=0; echo ok >\"$p\" || rc=1; rm -f \"$p\"; exit $rc",
                     shellQuote(marker));
}

std::string printEnvCommand(std::string_view name) {
  // Variable names are identifiers; anything else would not expand anyway
  return fmt::format("printf '%s\\n' \"${}\"", name);
}

std::string dockerVersionCommand() {
  return "docker version --format '{{.Server.Version}}'";
}

std::string dockerPsCommand() { return "docker ps --format '{{.Names}}\t{{.Status}}'"; }

std::string nestedExecCommand(std::string_view container, std::string_view innerCommand) {
  return fmt::format("docker exec {} sh -lc {}", shellQuote(container), shellQuote(innerCommand));
}

std::string dockerStatsCommand() {
  return "docker stats --no-stream --format "
         "'{{.Name}}\t{{.CPUPerc}}\t{{.MemUsage}}\t{{.MemPerc}}'";
}

std::string diskFreeCommand(std::string_view path) {
  return fmt::format("df -h {}", shellQuote(path));
}

std::string diskUsageCommand(std::string_view path) {
  return fmt::format("du -sk {}", shellQuote(path));
}

std::string idCommand(bool group) { return group ? "id -g" : "id -u"; }

std::string fileAgeCommand(std::string_view path) {
  return fmt::format("python -c 'import os,sys,time; "
                     "print(int(time.time() - os.path.getmtime(sys.argv[1])))' {}",
                     shellQuote(path));
}

/* ----------------------------- Parsers ----------------------------- */

std::optional<std::int64_t> parseFileAge(std::string_view output) {
  const std::optional<std::int64_t> AGE = parseInt64(trim(output));
  if (!AGE || *AGE < 0) {
    return std::nullopt;
  }
  return AGE;
}

std::optional<std::uint32_t> parseNumericId(std::string_view output) {
  const std::optional<std::int64_t> ID = parseInt64(trim(output));
  if (!ID || *ID < 0 || *ID > std::numeric_limits<std::uint32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(*ID);
}

} // namespace probe

} // namespace awgcheck
