#ifndef AWGCHECK_REPORT_REPORT_PRINTER_HPP
#define AWGCHECK_REPORT_REPORT_PRINTER_HPP
/**
 * @file ReportPrinter.hpp
 * @brief Human and JSON rendering of a finished health-check run.
 *
 * Rendering returns strings so the tool decides where output goes and tests
 * can inspect it.
 */

#include "src/report/inc/CheckRecorder.hpp"

#include <string>

namespace awgcheck {

namespace report {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Report header fields.
 */
struct ReportHeader {
  std::string title;     ///< Tool title
  bool full = false;     ///< Full mode (adds "(full)" to the title)
  std::string timestamp; ///< ISO-8601 run time, may be empty
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Glyph printed in front of a result line.
 * @return "✔", "▲" or "✖".
 */
[[nodiscard]] const char* severityGlyph(Severity severity) noexcept;

/**
 * @brief ANSI color escape for a severity.
 */
[[nodiscard]] const char* severityColor(Severity severity) noexcept;

/**
 * @brief Render the text report.
 *
 * One line per result with its glyph, notes indented by three spaces, section
 * rules, and a final verdict line.
 *
 * @param color Emit ANSI colors.
 */
[[nodiscard]] std::string formatHumanReport(const ReportHeader& header,
                                            const CheckRecorder& recorder,
                                            const Verdict& verdict, bool color);

/**
 * @brief Render the report as a JSON document.
 */
[[nodiscard]] std::string formatJsonReport(const ReportHeader& header,
                                           const CheckRecorder& recorder,
                                           const Verdict& verdict);

} // namespace report

} // namespace awgcheck

#endif // AWGCHECK_REPORT_REPORT_PRINTER_HPP
