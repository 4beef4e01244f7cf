#ifndef AWGCHECK_HELPERS_FORMAT_HPP
#define AWGCHECK_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable formatting for byte counts and durations.
 *
 * Shared by the report notes and the full-mode resource sections.
 */

#include <cstdint>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

namespace awgcheck {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format bytes using binary units (KiB, MiB, GiB, TiB).
 * @param bytes Byte count.
 * @return Formatted string (e.g., "1.5 GiB").
 */
[[nodiscard]] inline std::string bytesBinary(std::uint64_t bytes) {
  if (bytes == 0) {
    return "0 B";
  }

  static constexpr std::uint64_t KIB = 1024ULL;
  static constexpr std::uint64_t MIB = KIB * 1024ULL;
  static constexpr std::uint64_t GIB = MIB * 1024ULL;
  static constexpr std::uint64_t TIB = GIB * 1024ULL;

  if (bytes >= TIB) {
    return fmt::format("{:.1f} TiB", static_cast<double>(bytes) / static_cast<double>(TIB));
  }
  if (bytes >= GIB) {
    return fmt::format("{:.1f} GiB", static_cast<double>(bytes) / static_cast<double>(GIB));
  }
  if (bytes >= MIB) {
    return fmt::format("{:.1f} MiB", static_cast<double>(bytes) / static_cast<double>(MIB));
  }
  if (bytes >= KIB) {
    return fmt::format("{:.1f} KiB", static_cast<double>(bytes) / static_cast<double>(KIB));
  }

  return fmt::format("{} B", bytes);
}

/**
 * @brief Compact duration: "45s", "2m", "2m 5s", "1h", "1h 3m".
 *
 * Seconds are dropped once the duration reaches an hour. Negative input is
 * clamped to zero.
 */
[[nodiscard]] inline std::string humanSeconds(std::int64_t seconds) {
  if (seconds < 0) {
    seconds = 0;
  }
  if (seconds < 60) {
    return fmt::format("{}s", seconds);
  }

  const std::int64_t MINUTES = seconds / 60;
  const std::int64_t SECS = seconds % 60;
  if (MINUTES < 60) {
    return SECS == 0 ? fmt::format("{}m", MINUTES) : fmt::format("{}m {}s", MINUTES, SECS);
  }

  const std::int64_t HOURS = MINUTES / 60;
  const std::int64_t MINS = MINUTES % 60;
  return MINS == 0 ? fmt::format("{}h", HOURS) : fmt::format("{}h {}m", HOURS, MINS);
}

} // namespace format
} // namespace helpers
} // namespace awgcheck

#endif // AWGCHECK_HELPERS_FORMAT_HPP
