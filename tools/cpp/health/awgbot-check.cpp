/**
 * @file awgbot-check.cpp
 * @brief One-shot health check for the AWGBOT docker deployment.
 *
 * Verifies the compose project, the secret file and its readability by the
 * container user, the heartbeat, the Docker API proxy and the companion
 * VPN/proxy/DNS containers. Outputs ok/warn/bad lines and a verdict.
 * Exit code: 0 = no errors (warnings allowed), 1 = errors or usage error.
 */

#include "src/config/inc/RunConfig.hpp"
#include "src/health/inc/HealthOrchestrator.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/probe/inc/ComposeProbe.hpp"
#include "src/report/inc/ReportPrinter.hpp"

#include <array>
#include <ctime>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

#include <fmt/core.h>

namespace cfg = awgcheck::config;
namespace health = awgcheck::health;
namespace probe = awgcheck::probe;
namespace report = awgcheck::report;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_FULL = 1,
  ARG_JSON = 2,
  ARG_NO_COLOR = 3,
  ARG_ROOT = 4,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Health check for the AWGBOT docker deployment.\n"
    "Checks compose services, secret.env ownership and mode, heartbeat,\n"
    "data directory, Docker API proxy and the AWG/XRAY/DNS containers.";

/// Report title.
constexpr std::string_view TITLE = "AWGBOT quick check";

/// Build argument definitions.
awgcheck::helpers::args::ArgMap buildArgMap() {
  awgcheck::helpers::args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_FULL] = {"--full", 0, false, "Add resource usage and data directory disk usage"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_NO_COLOR] = {"--no-color", 0, false, "Disable ANSI colors"};
  map[ARG_ROOT] = {"--root", 1, false, "Deployment root (default /opt/awgbot)", "dir"};
  return map;
}

/* ----------------------------- Helpers ----------------------------- */

/// Local time as ISO-8601 with offset, e.g. "2026-10-19T10:00:00+02:00".
std::string isoTimestamp() {
  const std::time_t NOW = std::time(nullptr);
  struct tm local{};
  if (::localtime_r(&NOW, &local) == nullptr) {
    return {};
  }

  std::array<char, 32> buf{};
  const std::size_t LEN = std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%S%z", &local);
  std::string out(buf.data(), LEN);

  // %z gives +HHMM; ISO-8601 wants +HH:MM
  if (out.size() >= 5) {
    out.insert(out.size() - 2, 1, ':');
  }
  return out;
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const awgcheck::helpers::args::ArgMap ARG_MAP = buildArgMap();
  awgcheck::helpers::args::ParsedArgs pargs;
  bool fullMode = false;
  bool jsonOutput = false;
  bool color = (::isatty(STDOUT_FILENO) == 1);
  std::string rootDir(cfg::DEFAULT_ROOT_DIR);

  if (argc > 1) {
    std::vector<std::string_view> args;
    args.reserve(static_cast<std::size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) {
      args.emplace_back(argv[i]);
    }

    std::string error;
    if (!awgcheck::helpers::args::parseArgs(args, ARG_MAP, pargs, error)) {
      fmt::print(stderr, "Error: {}\n\n", error);
      awgcheck::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 1;
    }

    if (pargs.count(ARG_HELP) != 0) {
      awgcheck::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 0;
    }

    fullMode = (pargs.count(ARG_FULL) != 0);
    jsonOutput = (pargs.count(ARG_JSON) != 0);
    if (pargs.count(ARG_NO_COLOR) != 0) {
      color = false;
    }
    if (pargs.count(ARG_ROOT) != 0) {
      rootDir = std::string(pargs[ARG_ROOT][0]);
    }
  }

  // Resolve configuration and run
  const cfg::RunConfig CONFIG = cfg::loadRunConfig(rootDir);

  probe::ComposeProbeConfig probeConfig;
  probeConfig.projectDir = CONFIG.rootDir;
  probe::ComposeProbe composeProbe(probeConfig);

  health::HealthOrchestrator orchestrator(composeProbe, CONFIG, health::RunOptions{fullMode});
  const report::Verdict VERDICT = orchestrator.run();

  // Output results
  const report::ReportHeader HEADER{std::string(TITLE), fullMode, isoTimestamp()};
  if (jsonOutput) {
    fmt::print("{}", report::formatJsonReport(HEADER, orchestrator.recorder(), VERDICT));
  } else {
    fmt::print("{}", report::formatHumanReport(HEADER, orchestrator.recorder(), VERDICT, color));
  }

  return VERDICT.exitCode;
}
