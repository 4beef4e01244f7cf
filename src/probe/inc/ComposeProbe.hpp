#ifndef AWGCHECK_PROBE_COMPOSE_PROBE_HPP
#define AWGCHECK_PROBE_COMPOSE_PROBE_HPP
/**
 * @file ComposeProbe.hpp
 * @brief ExternalProbe backed by the Docker Compose CLI and POSIX calls.
 *
 * Compose commands run with the deployment root as working directory so the
 * project's docker-compose.yml and .env are picked up.
 */

#include "src/probe/inc/CommandRunner.hpp"
#include "src/probe/inc/ExternalProbe.hpp"

#include <string>
#include <vector>

namespace awgcheck {

namespace probe {

/* ----------------------------- Config ----------------------------- */

/// Deadline for commands executed inside a container.
inline constexpr int DEFAULT_EXEC_TIMEOUT_MS = 8000;

/**
 * @brief ComposeProbe settings.
 */
struct ComposeProbeConfig {
  std::string projectDir;                                       ///< Compose project root
  std::vector<std::string> composeCommand{"docker", "compose"}; ///< Compose CLI prefix
  int timeoutMs = DEFAULT_COMMAND_TIMEOUT_MS;                    ///< Listing deadline
  int execTimeoutMs = DEFAULT_EXEC_TIMEOUT_MS;                   ///< In-container deadline
};

/* ----------------------------- ComposeProbe ----------------------------- */

/**
 * @brief Real probe: "docker compose ps/exec", stat(2), getpwuid_r/getgrgid_r.
 */
class ComposeProbe final : public ExternalProbe {
public:
  explicit ComposeProbe(ComposeProbeConfig config) noexcept;

  [[nodiscard]] bool controlPlaneReachable() noexcept override;
  [[nodiscard]] std::optional<container::StatusListing> listServices() noexcept override;
  [[nodiscard]] ExecResult execInService(std::string_view service,
                                         std::string_view command) noexcept override;
  [[nodiscard]] std::optional<access::FileAccessDescriptor>
  statPath(const std::string& path) noexcept override;
  [[nodiscard]] std::optional<std::string> readLocalFile(const std::string& path) noexcept override;
  [[nodiscard]] bool localDirectoryExists(const std::string& path) noexcept override;
  [[nodiscard]] access::ProcessIdentity queryIdentity(std::string_view service) noexcept override;
  [[nodiscard]] std::optional<std::int64_t>
  heartbeatAgeSeconds(std::string_view service, std::string_view path) noexcept override;

  [[nodiscard]] const ComposeProbeConfig& config() const noexcept { return config_; }

private:
  /// Compose prefix followed by @p args.
  [[nodiscard]] std::vector<std::string> composeArgv(std::vector<std::string> args) const;

  ComposeProbeConfig config_;
};

/* ----------------------------- Host Lookups ----------------------------- */

/// @brief User name for @p uid, "" if unknown.
[[nodiscard]] std::string lookupUserName(std::uint32_t uid);

/// @brief Group name for @p gid, "" if unknown.
[[nodiscard]] std::string lookupGroupName(std::uint32_t gid);

/**
 * @brief stat(2) a host path into a FileAccessDescriptor.
 * @return nullopt if the path does not exist or cannot be stat'ed.
 */
[[nodiscard]] std::optional<access::FileAccessDescriptor>
statFileAccess(const std::string& path) noexcept;

} // namespace probe

} // namespace awgcheck

#endif // AWGCHECK_PROBE_COMPOSE_PROBE_HPP
