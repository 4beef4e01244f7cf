#ifndef AWGCHECK_CONTAINER_RESOURCE_USAGE_HPP
#define AWGCHECK_CONTAINER_RESOURCE_USAGE_HPP
/**
 * @file ResourceUsage.hpp
 * @brief Parsers for `docker stats` and `df` output used by the full report.
 *
 * Figures are kept as the text Docker and df print ("1.23%", "45MiB / 512MiB");
 * they are reported, never compared.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace awgcheck {

namespace container {

/* ----------------------------- ContainerUsage ----------------------------- */

/**
 * @brief One row of `docker stats --no-stream`.
 *
 * Expected input format: Name<TAB>CPUPerc<TAB>MemUsage<TAB>MemPerc.
 */
struct ContainerUsage {
  std::string name;       ///< Container name
  std::string cpuPercent; ///< e.g. "0.37%"
  std::string memUsage;   ///< e.g. "45.2MiB / 512MiB"
  std::string memPercent; ///< e.g. "8.83%"

  /// @brief Aligned one-line summary for the report.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Parse `docker stats` rows.
 *
 * Rows that do not have exactly four tab-separated fields are skipped.
 */
[[nodiscard]] std::vector<ContainerUsage> parseStatsListing(std::string_view text);

/* ----------------------------- DiskUsage ----------------------------- */

/**
 * @brief Usage of the filesystem holding a directory, from `df -h`.
 */
struct DiskUsage {
  std::string filesystem; ///< Source device or overlay
  std::string size;       ///< Total size ("20G")
  std::string used;       ///< Used ("3.1G")
  std::string available;  ///< Free ("16G")
  std::string usePercent; ///< "17%"

  /// @brief One-line summary for the report.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Parse the data row of `df -h <dir>`.
 *
 * Handles the wrapped layout where a long filesystem name sits alone on its
 * own line.
 * @return Parsed row, or nullopt if no row with at least five fields exists.
 */
[[nodiscard]] std::optional<DiskUsage> parseDfOutput(std::string_view text);

/**
 * @brief Parse `du -sk <dir>` output into bytes.
 * @return Size in bytes, or nullopt if the first field is not a number.
 */
[[nodiscard]] std::optional<std::uint64_t> parseDuKilobytes(std::string_view text);

} // namespace container

} // namespace awgcheck

#endif // AWGCHECK_CONTAINER_RESOURCE_USAGE_HPP
