/**
 * @file ContainerStatus.cpp
 * @brief Implementation of container status classification and listing parsing.
 */

#include "src/container/inc/ContainerStatus.hpp"
#include "src/helpers/inc/Strings.hpp"

namespace awgcheck {

namespace container {

namespace strings = awgcheck::helpers::strings;

/* ----------------------------- ContainerState toString ----------------------------- */

const char* toString(ContainerState state) noexcept {
  switch (state) {
  case ContainerState::OK:
    return "ok";
  case ContainerState::DEGRADED:
    return "degraded";
  case ContainerState::ABSENT:
  default:
    return "absent";
  }
}

/* ----------------------------- ContainerStatusReport ----------------------------- */

bool ContainerStatusReport::reportsHealthy() const {
  const std::string LOW = strings::toLower(status);
  return LOW.find("healthy") != std::string::npos && LOW.find("unhealthy") == std::string::npos;
}

bool ContainerStatusReport::isRunning() const {
  return state != ContainerState::ABSENT &&
         strings::toLower(status).find("up") != std::string::npos;
}

/* ----------------------------- API ----------------------------- */

ContainerState classifyContainerStatus(std::optional<std::string_view> status) {
  if (!status) {
    return ContainerState::ABSENT;
  }

  const std::string LOW = strings::toLower(*status);
  if (LOW.find("unhealthy") != std::string::npos || LOW.find("restarting") != std::string::npos) {
    return ContainerState::DEGRADED;
  }
  if (LOW.find("up") != std::string::npos || LOW.find("healthy") != std::string::npos) {
    return ContainerState::OK;
  }
  return ContainerState::DEGRADED;
}

StatusListing parseStatusListing(std::string_view text) {
  StatusListing listing;
  for (const std::string_view LINE : strings::splitLines(text)) {
    const std::size_t TAB = LINE.find('\t');
    const std::string_view NAME = strings::trim(LINE.substr(0, TAB));
    if (NAME.empty()) {
      continue;
    }
    const std::string_view STATUS =
        (TAB == std::string_view::npos) ? std::string_view{} : strings::trim(LINE.substr(TAB + 1));
    listing.insert_or_assign(std::string(NAME), std::string(STATUS));
  }
  return listing;
}

ContainerStatusReport lookupContainer(const StatusListing& listing, std::string_view name) {
  ContainerStatusReport report;
  report.name = std::string(name);

  const auto IT = listing.find(name);
  if (IT == listing.end()) {
    report.state = classifyContainerStatus(std::nullopt);
    return report;
  }

  report.status = IT->second;
  report.state = classifyContainerStatus(std::string_view(IT->second));
  return report;
}

} // namespace container

} // namespace awgcheck
