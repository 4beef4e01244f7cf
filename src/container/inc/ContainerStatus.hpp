#ifndef AWGCHECK_CONTAINER_CONTAINER_STATUS_HPP
#define AWGCHECK_CONTAINER_CONTAINER_STATUS_HPP
/**
 * @file ContainerStatus.hpp
 * @brief Classification of Docker / Compose status text.
 *
 * Status strings are vendor free text ("Up 3 minutes (healthy)",
 * "Restarting (1) 4 seconds ago", "Exited (0) 2 hours ago"). They are reduced
 * to a three-valued state in one place so every check interprets them alike.
 */

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace awgcheck {

namespace container {

/* ----------------------------- ContainerState ----------------------------- */

/**
 * @brief Observed container state.
 */
enum class ContainerState : std::uint8_t {
  ABSENT = 0,   ///< Not present in the listing at all
  DEGRADED = 1, ///< Present but unhealthy, restarting, or unrecognized
  OK = 2        ///< Up and/or healthy
};

/**
 * @brief Convert state to string.
 * @return "ok", "degraded" or "absent".
 */
[[nodiscard]] const char* toString(ContainerState state) noexcept;

/* ----------------------------- Listing ----------------------------- */

/// Container or service name to raw status text.
using StatusListing = std::map<std::string, std::string, std::less<>>;

/**
 * @brief One named container's observed state.
 */
struct ContainerStatusReport {
  std::string name;                        ///< Container / service name
  std::string status;                      ///< Raw status text ("" when absent)
  ContainerState state = ContainerState::ABSENT; ///< Classification

  /// @brief Listed with a status that reports the container as up.
  [[nodiscard]] bool isRunning() const;

  /// @brief Raw status mentions a passing health check ("healthy" but not "unhealthy").
  [[nodiscard]] bool reportsHealthy() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Classify a status string.
 *
 * Case-insensitive, priority order:
 *  1. no entry (nullopt)                      -> ABSENT
 *  2. contains "unhealthy" or "restarting"    -> DEGRADED
 *  3. contains "up" or "healthy"              -> OK
 *  4. anything else                           -> DEGRADED
 *
 * @param status Raw status, or nullopt if the container is not listed.
 */
[[nodiscard]] ContainerState classifyContainerStatus(std::optional<std::string_view> status);

/**
 * @brief Parse "name<TAB>status" lines.
 *
 * Blank names are skipped, a later duplicate replaces an earlier entry, and a
 * line without a tab yields an empty status.
 */
[[nodiscard]] StatusListing parseStatusListing(std::string_view text);

/**
 * @brief Look up and classify one container.
 */
[[nodiscard]] ContainerStatusReport lookupContainer(const StatusListing& listing,
                                                    std::string_view name);

} // namespace container

} // namespace awgcheck

#endif // AWGCHECK_CONTAINER_CONTAINER_STATUS_HPP
