#ifndef AWGCHECK_HEALTH_HEARTBEAT_HPP
#define AWGCHECK_HEALTH_HEARTBEAT_HPP
/**
 * @file Heartbeat.hpp
 * @brief Heartbeat freshness rule.
 */

#include "src/report/inc/CheckRecorder.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace awgcheck {

namespace health {

/// Heartbeat older than this many seconds is stale.
inline constexpr std::int64_t HEARTBEAT_STALE_SECONDS = 120;

/**
 * @brief Classify a heartbeat age.
 *
 * 0 <= age < 120 is OK, age >= 120 is WARN, missing or negative is BAD.
 */
[[nodiscard]] report::Severity classifyHeartbeat(std::optional<std::int64_t> ageSeconds) noexcept;

/// @brief Report line for a heartbeat age ("heartbeat OK (45s)", ...).
[[nodiscard]] std::string heartbeatMessage(std::optional<std::int64_t> ageSeconds);

} // namespace health

} // namespace awgcheck

#endif // AWGCHECK_HEALTH_HEARTBEAT_HPP
