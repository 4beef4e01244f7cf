#ifndef AWGCHECK_HEALTH_UTST_FAKE_PROBE_HPP
#define AWGCHECK_HEALTH_UTST_FAKE_PROBE_HPP
/**
 * @file FakeProbe.hpp
 * @brief In-memory ExternalProbe for orchestrator tests.
 *
 * Exec responses are keyed by the exact command line. Unknown commands fail
 * with exit code 1. Every exec is logged.
 */

#include "src/probe/inc/ExternalProbe.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace awgcheck {

namespace health {

namespace test {

class FakeProbe final : public probe::ExternalProbe {
public:
  bool rootExists = true;
  bool reachable = true;
  std::optional<container::StatusListing> services;
  std::map<std::string, std::string> files;
  std::map<std::string, access::FileAccessDescriptor> stats;
  access::ProcessIdentity identity;
  std::optional<std::int64_t> heartbeatAge;
  std::map<std::string, probe::ExecResult> execResponses;

  std::vector<std::pair<std::string, std::string>> execLog; ///< (service, command)
  int identityQueries = 0;

  /// Register a successful command with @p output.
  void succeed(const std::string& command, std::string output = {}) {
    execResponses[command] = probe::ExecResult{true, 0, std::move(output)};
  }

  /// Register a command that runs but exits non-zero.
  void fail(const std::string& command, int exitCode = 1) {
    execResponses[command] = probe::ExecResult{true, exitCode, {}};
  }

  bool controlPlaneReachable() noexcept override { return reachable; }

  std::optional<container::StatusListing> listServices() noexcept override { return services; }

  probe::ExecResult execInService(std::string_view service,
                                  std::string_view command) noexcept override {
    execLog.emplace_back(std::string(service), std::string(command));
    const auto IT = execResponses.find(std::string(command));
    if (IT == execResponses.end()) {
      return probe::ExecResult{true, 1, {}};
    }
    return IT->second;
  }

  std::optional<access::FileAccessDescriptor> statPath(const std::string& path) noexcept override {
    const auto IT = stats.find(path);
    if (IT == stats.end()) {
      return std::nullopt;
    }
    return IT->second;
  }

  std::optional<std::string> readLocalFile(const std::string& path) noexcept override {
    const auto IT = files.find(path);
    if (IT == files.end()) {
      return std::nullopt;
    }
    return IT->second;
  }

  bool localDirectoryExists(const std::string&) noexcept override { return rootExists; }

  access::ProcessIdentity queryIdentity(std::string_view) noexcept override {
    ++identityQueries;
    return identity;
  }

  std::optional<std::int64_t> heartbeatAgeSeconds(std::string_view,
                                                  std::string_view) noexcept override {
    return heartbeatAge;
  }
};

} // namespace test

} // namespace health

} // namespace awgcheck

#endif // AWGCHECK_HEALTH_UTST_FAKE_PROBE_HPP
