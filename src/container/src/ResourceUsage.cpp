/**
 * @file ResourceUsage.cpp
 * @brief Implementation of `docker stats`, `df` and `du` output parsing.
 */

#include "src/container/inc/ResourceUsage.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <fmt/core.h>

namespace awgcheck {

namespace container {

namespace strings = awgcheck::helpers::strings;

namespace {

/// Split on every tab, keeping empty fields.
std::vector<std::string_view> splitTabs(std::string_view line) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    const std::size_t TAB = line.find('\t', start);
    if (TAB == std::string_view::npos) {
      fields.push_back(line.substr(start));
      break;
    }
    fields.push_back(line.substr(start, TAB - start));
    start = TAB + 1;
  }
  return fields;
}

} // namespace

/* ----------------------------- ContainerUsage ----------------------------- */

std::string ContainerUsage::toString() const {
  return fmt::format("{:<20} CPU {:<8} MEM {:<22} ({})", name, cpuPercent, memUsage, memPercent);
}

std::vector<ContainerUsage> parseStatsListing(std::string_view text) {
  std::vector<ContainerUsage> rows;
  for (const std::string_view LINE : strings::splitLines(text)) {
    const std::vector<std::string_view> FIELDS = splitTabs(LINE);
    if (FIELDS.size() != 4) {
      continue;
    }
    ContainerUsage row;
    row.name = std::string(strings::trim(FIELDS[0]));
    row.cpuPercent = std::string(strings::trim(FIELDS[1]));
    row.memUsage = std::string(strings::trim(FIELDS[2]));
    row.memPercent = std::string(strings::trim(FIELDS[3]));
    if (row.name.empty()) {
      continue;
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

/* ----------------------------- DiskUsage ----------------------------- */

std::string DiskUsage::toString() const {
  return fmt::format("size: {}; used: {}; free: {} ({})", size, used, available, usePercent);
}

std::optional<DiskUsage> parseDfOutput(std::string_view text) {
  const std::vector<std::string_view> LINES = strings::splitLines(text);

  // Skip the header, then gather fields until a full row is seen.
  std::vector<std::string_view> fields;
  for (std::size_t i = 1; i < LINES.size(); ++i) {
    for (const std::string_view FIELD : strings::splitFields(LINES[i])) {
      fields.push_back(FIELD);
    }
    if (fields.size() >= 5) {
      break;
    }
  }

  if (fields.size() < 5) {
    return std::nullopt;
  }

  DiskUsage usage;
  usage.filesystem = std::string(fields[0]);
  usage.size = std::string(fields[1]);
  usage.used = std::string(fields[2]);
  usage.available = std::string(fields[3]);
  usage.usePercent = std::string(fields[4]);
  return usage;
}

std::optional<std::uint64_t> parseDuKilobytes(std::string_view text) {
  const std::vector<std::string_view> FIELDS = strings::splitFields(text);
  if (FIELDS.empty()) {
    return std::nullopt;
  }
  const std::optional<std::int64_t> KB = strings::parseInt64(FIELDS[0]);
  if (!KB || *KB < 0) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(*KB) * 1024ULL;
}

} // namespace container

} // namespace awgcheck
