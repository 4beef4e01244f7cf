#ifndef AWGCHECK_PROBE_EXTERNAL_PROBE_HPP
#define AWGCHECK_PROBE_EXTERNAL_PROBE_HPP
/**
 * @file ExternalProbe.hpp
 * @brief Read-only queries against the deployment, behind one interface.
 *
 * Every query the health run makes against the host, the orchestration layer
 * or a running container goes through ExternalProbe. Implementations never
 * throw: failures are empty optionals, false, or an ExecResult that did not
 * succeed.
 */

#include "src/access/inc/AccessEvaluator.hpp"
#include "src/container/inc/ContainerStatus.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace awgcheck {

namespace probe {

/* ----------------------------- ExecResult ----------------------------- */

/**
 * @brief Outcome of a command run inside a service container.
 */
struct ExecResult {
  bool ran = false;   ///< Command was started and reaped before the timeout
  int exitCode = -1;  ///< Exit status (-1 if it did not run or was signalled)
  std::string output; ///< Captured stdout

  /// @brief True if the command ran and exited 0.
  [[nodiscard]] bool succeeded() const noexcept { return ran && exitCode == 0; }
};

/* ----------------------------- ExternalProbe ----------------------------- */

/**
 * @brief Collaborator interface used by the health orchestrator.
 */
class ExternalProbe {
public:
  virtual ~ExternalProbe() = default;

  /// @brief Orchestration layer answers a service listing request.
  [[nodiscard]] virtual bool controlPlaneReachable() noexcept = 0;

  /// @brief Service name to status text for the compose project.
  [[nodiscard]] virtual std::optional<container::StatusListing> listServices() noexcept = 0;

  /**
   * @brief Run a shell command inside a service container.
   * @param service Compose service name.
   * @param command Shell command line, interpreted by "sh -lc".
   */
  [[nodiscard]] virtual ExecResult execInService(std::string_view service,
                                                 std::string_view command) noexcept = 0;

  /// @brief Mode and ownership of a host path.
  [[nodiscard]] virtual std::optional<access::FileAccessDescriptor>
  statPath(const std::string& path) noexcept = 0;

  /// @brief Contents of a host file readable by the current user.
  [[nodiscard]] virtual std::optional<std::string>
  readLocalFile(const std::string& path) noexcept = 0;

  /// @brief True if @p path is an existing host directory.
  [[nodiscard]] virtual bool localDirectoryExists(const std::string& path) noexcept = 0;

  /// @brief Effective uid/gid of the main process of a service.
  [[nodiscard]] virtual access::ProcessIdentity
  queryIdentity(std::string_view service) noexcept = 0;

  /**
   * @brief Seconds since @p path inside @p service was last modified.
   * @return Age, or nullopt if the file is missing or the query failed.
   */
  [[nodiscard]] virtual std::optional<std::int64_t>
  heartbeatAgeSeconds(std::string_view service, std::string_view path) noexcept = 0;

protected:
  ExternalProbe() = default;
  ExternalProbe(const ExternalProbe&) = default;
  ExternalProbe& operator=(const ExternalProbe&) = default;
};

} // namespace probe

} // namespace awgcheck

#endif // AWGCHECK_PROBE_EXTERNAL_PROBE_HPP
