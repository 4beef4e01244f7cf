/**
 * @file Heartbeat.cpp
 * @brief Implementation of the heartbeat freshness rule.
 */

#include "src/health/inc/Heartbeat.hpp"
#include "src/helpers/inc/Format.hpp"

#include <fmt/core.h>

namespace awgcheck {

namespace health {

using report::Severity;

Severity classifyHeartbeat(std::optional<std::int64_t> ageSeconds) noexcept {
  if (!ageSeconds || *ageSeconds < 0) {
    return Severity::BAD;
  }
  return *ageSeconds < HEARTBEAT_STALE_SECONDS ? Severity::OK : Severity::WARN;
}

std::string heartbeatMessage(std::optional<std::int64_t> ageSeconds) {
  switch (classifyHeartbeat(ageSeconds)) {
  case Severity::OK:
    return fmt::format("heartbeat OK ({})", helpers::format::humanSeconds(*ageSeconds));
  case Severity::WARN:
    return fmt::format("heartbeat stale ({})", helpers::format::humanSeconds(*ageSeconds));
  case Severity::BAD:
    break;
  }
  return "heartbeat not found";
}

} // namespace health

} // namespace awgcheck
