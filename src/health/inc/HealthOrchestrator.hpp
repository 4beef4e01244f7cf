#ifndef AWGCHECK_HEALTH_HEALTH_ORCHESTRATOR_HPP
#define AWGCHECK_HEALTH_HEALTH_ORCHESTRATOR_HPP
/**
 * @file HealthOrchestrator.hpp
 * @brief One health-check run: INIT -> PRECHECK -> CHECKS -> SUMMARY -> DONE.
 *
 * PRECHECK is fail-fast: the first failure records one bad result and the
 * run jumps straight to SUMMARY. CHECKS run in a fixed order and never stop
 * early. All external queries go through the supplied ExternalProbe; the
 * orchestrator holds no other state than its CheckRecorder.
 */

#include "src/config/inc/RunConfig.hpp"
#include "src/container/inc/ContainerStatus.hpp"
#include "src/probe/inc/ExternalProbe.hpp"
#include "src/report/inc/CheckRecorder.hpp"

#include <cstdint>

namespace awgcheck {

namespace health {

/* ----------------------------- RunState ----------------------------- */

/**
 * @brief Orchestrator lifecycle.
 */
enum class RunState : std::uint8_t {
  INIT = 0, ///< Constructed, nothing recorded
  PRECHECK, ///< Fatal preconditions
  CHECKS,   ///< Regular checks
  SUMMARY,  ///< Verdict computed
  DONE,     ///< Terminal
};

/// @brief Human-readable state name.
[[nodiscard]] const char* toString(RunState state) noexcept;

/* ----------------------------- RunOptions ----------------------------- */

/**
 * @brief Per-run switches.
 */
struct RunOptions {
  bool full = false; ///< Append resource and filesystem sections
};

/* ----------------------------- HealthOrchestrator ----------------------------- */

/**
 * @brief Sequences all checks against one deployment.
 *
 * Usage:
 * @code
 *   ComposeProbe probe(cfg);
 *   HealthOrchestrator orch(probe, loadRunConfig("/opt/awgbot"), {});
 *   const Verdict V = orch.run();
 * @endcode
 */
class HealthOrchestrator {
public:
  HealthOrchestrator(probe::ExternalProbe& probe, config::RunConfig config,
                     RunOptions options = {}) noexcept;

  /**
   * @brief Execute the run to DONE and return its verdict.
   * @note Only the first call runs checks; later calls return the same verdict.
   */
  [[nodiscard]] report::Verdict run();

  [[nodiscard]] RunState state() const noexcept { return state_; }
  [[nodiscard]] const report::CheckRecorder& recorder() const noexcept { return recorder_; }
  [[nodiscard]] const config::RunConfig& config() const noexcept { return config_; }
  [[nodiscard]] const RunOptions& options() const noexcept { return options_; }

private:
  /// Returns false on the first fatal failure.
  [[nodiscard]] bool runPrecheck();
  void runChecks();

  void checkServices();
  void checkSecret();
  void checkSecretMount();
  void checkHeartbeat();
  void checkDataWritable();
  void checkDockerHost();
  void checkDaemon();
  void checkDependentContainers();
  void checkNestedConfigs();
  void reportResources();
  void reportFilesystem();

  /// Run a command in the control service.
  [[nodiscard]] probe::ExecResult execInBot(std::string_view command);

  probe::ExternalProbe& probe_;
  config::RunConfig config_;
  RunOptions options_;
  RunState state_{RunState::INIT};
  report::CheckRecorder recorder_;
  container::StatusListing services_;
};

} // namespace health

} // namespace awgcheck

#endif // AWGCHECK_HEALTH_HEALTH_ORCHESTRATOR_HPP
