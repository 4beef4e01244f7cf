/**
 * @file HealthOrchestrator.cpp
 * @brief Implementation of the health-check run state machine.
 */

#include "src/health/inc/HealthOrchestrator.hpp"
#include "src/access/inc/AccessEvaluator.hpp"
#include "src/container/inc/ResourceUsage.hpp"
#include "src/health/inc/Heartbeat.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/probe/inc/ProbeCommands.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace awgcheck {

namespace health {

namespace strings = awgcheck::helpers::strings;

using container::ContainerState;
using container::ContainerStatusReport;
using report::Severity;

/* ----------------------------- RunState ----------------------------- */

const char* toString(RunState state) noexcept {
  switch (state) {
  case RunState::INIT:
    return "init";
  case RunState::PRECHECK:
    return "precheck";
  case RunState::CHECKS:
    return "checks";
  case RunState::SUMMARY:
    return "summary";
  case RunState::DONE:
    return "done";
  }
  return "unknown";
}

/* ----------------------------- Lifecycle ----------------------------- */

HealthOrchestrator::HealthOrchestrator(probe::ExternalProbe& probe, config::RunConfig config,
                                       RunOptions options) noexcept
    : probe_{probe}, config_{std::move(config)}, options_{options} {}

report::Verdict HealthOrchestrator::run() {
  if (state_ != RunState::INIT) {
    return recorder_.finalize();
  }

  state_ = RunState::PRECHECK;
  if (runPrecheck()) {
    state_ = RunState::CHECKS;
    runChecks();
  }

  state_ = RunState::SUMMARY;
  const report::Verdict VERDICT = recorder_.finalize();
  state_ = RunState::DONE;
  return VERDICT;
}

probe::ExecResult HealthOrchestrator::execInBot(std::string_view command) {
  return probe_.execInService(config_.botService, command);
}

/* ----------------------------- Precheck ----------------------------- */

bool HealthOrchestrator::runPrecheck() {
  if (!probe_.localDirectoryExists(config_.rootDir)) {
    recorder_.bad(fmt::format("deployment directory not found: {}", config_.rootDir));
    return false;
  }

  if (!probe_.controlPlaneReachable()) {
    recorder_.bad("docker compose is not working");
    return false;
  }
  recorder_.ok("docker compose available");

  services_ = probe_.listServices().value_or(container::StatusListing{});
  for (const std::string* name : {&config_.botService, &config_.proxyService}) {
    if (!container::lookupContainer(services_, *name).isRunning()) {
      recorder_.bad(fmt::format("service {} not found", *name));
      return false;
    }
  }

  for (const std::string* name : {&config_.botService, &config_.proxyService}) {
    recorder_.note(fmt::format("{:<14} {}", *name, services_.find(*name)->second));
  }
  return true;
}

/* ----------------------------- Checks ----------------------------- */

void HealthOrchestrator::runChecks() {
  checkServices();
  checkSecret();
  checkSecretMount();
  checkHeartbeat();
  checkDataWritable();
  checkDockerHost();
  checkDaemon();
  checkDependentContainers();
  checkNestedConfigs();

  recorder_.note(fmt::format("docker-proxy log level: {}", config_.proxyLogLevel));

  if (options_.full) {
    reportResources();
    reportFilesystem();
  }
}

void HealthOrchestrator::checkServices() {
  const ContainerStatusReport BOT = container::lookupContainer(services_, config_.botService);
  if (BOT.state == ContainerState::OK && BOT.reportsHealthy()) {
    recorder_.ok(fmt::format("{} healthy", BOT.name));
  } else {
    recorder_.warn(fmt::format("{} not healthy ({})", BOT.name, BOT.status));
  }

  const ContainerStatusReport PROXY = container::lookupContainer(services_, config_.proxyService);
  if (PROXY.state == ContainerState::OK) {
    recorder_.ok(fmt::format("{} running", PROXY.name));
  } else {
    recorder_.warn(fmt::format("{} not running ({})", PROXY.name, PROXY.status));
  }
}

void HealthOrchestrator::checkSecret() {
  const std::string& PATH = config_.secretPath;
  const std::optional<std::string> TEXT = probe_.readLocalFile(PATH);
  if (!TEXT) {
    recorder_.bad(fmt::format("secret.env missing or unreadable: {}", PATH));
    return;
  }
  recorder_.ok("secret.env found");

  const access::FileAccessDescriptor SECRET_FILE =
      probe_.statPath(PATH).value_or(access::FileAccessDescriptor{});
  const access::ProcessIdentity IDENTITY = probe_.queryIdentity(config_.botService);
  recorder_.note(fmt::format("secret.env: {} container uid/gid={}", SECRET_FILE.toString(),
                             IDENTITY.toString()));

  const access::AccessDecision DECISION = access::evaluateAccess(SECRET_FILE, IDENTITY);
  if (DECISION.readable) {
    recorder_.ok("secret.env readable by the container");
    if (DECISION.hasHint()) {
      recorder_.warn(fmt::format("security: {} ({})", DECISION.hint(),
                                 access::securityHint(DECISION, PATH)));
    }
  } else {
    recorder_.bad("secret.env NOT readable by the container (uid/gid or mode mismatch)");
    recorder_.note(fmt::format("fix: {}", access::remediationCommand(IDENTITY, PATH)));
  }

  for (const std::string_view KEY : config::REQUIRED_SECRET_KEYS) {
    if (config::hasKeyAssignment(*TEXT, KEY)) {
      recorder_.ok(fmt::format("{} present", KEY));
    } else {
      recorder_.bad(fmt::format("{} missing", KEY));
    }
  }
}

void HealthOrchestrator::checkSecretMount() {
  if (execInBot(probe::readableTestCommand(config::SECRET_MOUNT_PATH)).succeeded()) {
    recorder_.ok("secret.env mounted in the container");
  } else {
    recorder_.bad(fmt::format("secret.env not mounted in the container ({})",
                              config::SECRET_MOUNT_PATH));
  }
}

void HealthOrchestrator::checkHeartbeat() {
  const std::optional<std::int64_t> AGE =
      probe_.heartbeatAgeSeconds(config_.botService, config::HEARTBEAT_PATH);
  recorder_.record(classifyHeartbeat(AGE), heartbeatMessage(AGE));
}

void HealthOrchestrator::checkDataWritable() {
  if (execInBot(probe::writeProbeCommand(config::DATA_DIR)).succeeded()) {
    recorder_.ok(fmt::format("{} writable", config::DATA_DIR));
  } else {
    recorder_.bad(fmt::format("{} not writable", config::DATA_DIR));
  }
}

void HealthOrchestrator::checkDockerHost() {
  const probe::ExecResult RES = execInBot(probe::printEnvCommand("DOCKER_HOST"));
  const std::string_view VALUE = RES.ran ? strings::trim(RES.output) : std::string_view{};
  if (VALUE == config::EXPECTED_DOCKER_HOST) {
    recorder_.ok(fmt::format("DOCKER_HOST={}", config::EXPECTED_DOCKER_HOST));
  } else if (VALUE.empty()) {
    recorder_.bad(fmt::format("DOCKER_HOST not set to {}", config::EXPECTED_DOCKER_HOST));
  } else {
    recorder_.bad(fmt::format("DOCKER_HOST not set to {} (found {})", config::EXPECTED_DOCKER_HOST,
                              VALUE));
  }
}

void HealthOrchestrator::checkDaemon() {
  const probe::ExecResult RES = execInBot(probe::dockerVersionCommand());
  const std::string_view VERSION = RES.succeeded() ? strings::trim(RES.output) : std::string_view{};
  if (!VERSION.empty()) {
    recorder_.ok(fmt::format("docker daemon reachable through the proxy (v{})", VERSION));
  } else {
    recorder_.bad("docker daemon not reachable through the proxy");
  }
}

void HealthOrchestrator::checkDependentContainers() {
  const probe::ExecResult RES = execInBot(probe::dockerPsCommand());
  const container::StatusListing LISTING =
      RES.succeeded() ? container::parseStatusListing(RES.output) : container::StatusListing{};

  const std::string* const NAMES[] = {&config_.awgContainer, &config_.xrayContainer,
                                      &config_.dnsContainer, &config_.botService};
  for (const std::string* name : NAMES) {
    if (strings::trim(*name).empty()) {
      continue;
    }
    const ContainerStatusReport REPORT = container::lookupContainer(LISTING, *name);
    switch (REPORT.state) {
    case ContainerState::OK:
      recorder_.ok(fmt::format("{}: {}", REPORT.name, REPORT.status));
      break;
    case ContainerState::DEGRADED:
      recorder_.warn(fmt::format("{}: {}", REPORT.name, REPORT.status));
      break;
    case ContainerState::ABSENT:
      recorder_.bad(fmt::format("{}: not running", REPORT.name));
      break;
    }
  }
}

void HealthOrchestrator::checkNestedConfigs() {
  struct NestedConfig {
    const char* label;
    const std::string* containerName;
    const std::string* path;
  };
  const NestedConfig TARGETS[] = {
      {"XRay", &config_.xrayContainer, &config_.xrayConfigPath},
      {"AmneziaWG", &config_.awgContainer, &config_.awgConfigPath},
  };

  for (const NestedConfig& T : TARGETS) {
    if (strings::trim(*T.containerName).empty()) {
      continue;
    }
    const std::string CMD =
        probe::nestedExecCommand(*T.containerName, probe::readableTestCommand(*T.path));
    if (execInBot(CMD).succeeded()) {
      recorder_.ok(fmt::format("{} config readable in {}", T.label, *T.containerName));
    } else {
      recorder_.bad(
          fmt::format("{} config NOT readable in {} ({})", T.label, *T.containerName, *T.path));
    }
  }
}

/* ----------------------------- Full Mode ----------------------------- */

void HealthOrchestrator::reportResources() {
  recorder_.section("Resources (docker stats)");

  const probe::ExecResult RES = execInBot(probe::dockerStatsCommand());
  const std::vector<container::ContainerUsage> USAGE =
      RES.succeeded() ? container::parseStatsListing(RES.output)
                      : std::vector<container::ContainerUsage>{};
  if (USAGE.empty()) {
    recorder_.note("docker stats unavailable");
    return;
  }
  for (const container::ContainerUsage& U : USAGE) {
    recorder_.note(U.toString());
  }
}

void HealthOrchestrator::reportFilesystem() {
  recorder_.section(fmt::format("Filesystem ({})", config::DATA_DIR));

  const probe::ExecResult DF = execInBot(probe::diskFreeCommand(config::DATA_DIR));
  const std::optional<container::DiskUsage> DISK =
      DF.succeeded() ? container::parseDfOutput(DF.output) : std::nullopt;
  recorder_.note(DISK ? DISK->toString() : std::string("disk usage unavailable"));

  const probe::ExecResult DU = execInBot(probe::diskUsageCommand(config::DATA_DIR));
  const std::optional<std::uint64_t> BYTES =
      DU.succeeded() ? container::parseDuKilobytes(DU.output) : std::nullopt;
  if (BYTES) {
    recorder_.note(
        fmt::format("{} size: {}", config::DATA_DIR, helpers::format::bytesBinary(*BYTES)));
  }
}

} // namespace health

} // namespace awgcheck
