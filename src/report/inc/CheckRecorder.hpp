#ifndef AWGCHECK_REPORT_CHECK_RECORDER_HPP
#define AWGCHECK_REPORT_CHECK_RECORDER_HPP
/**
 * @file CheckRecorder.hpp
 * @brief Tally of check outcomes and the final verdict rule.
 *
 * Design goals:
 *  - Explicit value object owned by one run (no global counters)
 *  - Pure state mutation, no I/O (rendering lives in ReportPrinter)
 *  - Verdict derived only from the three counters
 */

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace awgcheck {

namespace report {

/* ----------------------------- Severity ----------------------------- */

/**
 * @brief Outcome severity; ordered OK < WARN < BAD.
 */
enum class Severity : std::uint8_t {
  OK = 0,   ///< Check passed
  WARN = 1, ///< Functional but sub-optimal
  BAD = 2   ///< Check failed
};

/**
 * @brief Convert severity to string.
 * @return "ok", "warn" or "bad".
 */
[[nodiscard]] const char* toString(Severity severity) noexcept;

/* ----------------------------- Report Lines ----------------------------- */

/**
 * @brief Kind of report line.
 */
enum class LineKind : std::uint8_t {
  RESULT = 0, ///< A counted CheckResult
  NOTE = 1,   ///< Informational detail, not counted
  SECTION = 2 ///< Section header, not counted
};

/**
 * @brief One line of the report, in run order.
 */
struct ReportLine {
  LineKind kind = LineKind::NOTE;    ///< Line kind
  Severity severity = Severity::OK;  ///< Meaningful for RESULT only
  std::string text;                  ///< Message, note text or section title
};

/* ----------------------------- Verdict ----------------------------- */

/**
 * @brief Overall run outcome.
 */
enum class VerdictKind : std::uint8_t {
  ALL_CLEAR = 0, ///< No warnings, no errors
  WARNINGS = 1,  ///< Warnings only
  ERRORS = 2     ///< At least one bad result
};

/**
 * @brief Convert verdict kind to string.
 * @return "all clear", "warnings present" or "errors present".
 */
[[nodiscard]] const char* toString(VerdictKind kind) noexcept;

/**
 * @brief Final verdict with the counts it was derived from.
 */
struct Verdict {
  VerdictKind kind = VerdictKind::ALL_CLEAR; ///< Roll-up
  int exitCode = 0;                          ///< Process exit code (0 or 1)
  std::uint32_t okCount = 0;                 ///< Passed checks
  std::uint32_t warnCount = 0;               ///< Warnings
  std::uint32_t badCount = 0;                ///< Errors

  /// @brief Total number of counted results.
  [[nodiscard]] std::uint32_t total() const noexcept { return okCount + warnCount + badCount; }

  /**
   * @brief Count summary, e.g. "errors: 1; warnings: 2; total checks: 9".
   */
  [[nodiscard]] std::string summary() const;
};

/**
 * @brief Verdict rule as a free function.
 *
 * bad > 0 -> ERRORS / exit 1; else warn > 0 -> WARNINGS / exit 0;
 * else ALL_CLEAR / exit 0.
 */
[[nodiscard]] Verdict resolveVerdict(std::uint32_t ok, std::uint32_t warn,
                                     std::uint32_t bad) noexcept;

/* ----------------------------- CheckRecorder ----------------------------- */

/**
 * @brief Running tally for one health-check run.
 *
 * Counters only grow. finalize() is meant to be called once, at the end of the
 * run; calling it earlier under-reports.
 */
class CheckRecorder {
public:
  /// @brief Append a result and bump its counter.
  void record(Severity severity, std::string message);

  void ok(std::string message) { record(Severity::OK, std::move(message)); }
  void warn(std::string message) { record(Severity::WARN, std::move(message)); }
  void bad(std::string message) { record(Severity::BAD, std::move(message)); }

  /// @brief Append an uncounted detail line.
  void note(std::string text);

  /// @brief Append an uncounted section header.
  void section(std::string title);

  [[nodiscard]] std::uint32_t okCount() const noexcept { return okCount_; }
  [[nodiscard]] std::uint32_t warnCount() const noexcept { return warnCount_; }
  [[nodiscard]] std::uint32_t badCount() const noexcept { return badCount_; }

  /// @brief All lines in the order they were recorded.
  [[nodiscard]] const std::vector<ReportLine>& lines() const noexcept { return lines_; }

  /// @brief Derive the verdict from the counters. Idempotent.
  [[nodiscard]] Verdict finalize() const noexcept;

private:
  std::vector<ReportLine> lines_;
  std::uint32_t okCount_ = 0;
  std::uint32_t warnCount_ = 0;
  std::uint32_t badCount_ = 0;
};

} // namespace report

} // namespace awgcheck

#endif // AWGCHECK_REPORT_CHECK_RECORDER_HPP
