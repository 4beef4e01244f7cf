/**
 * @file CheckRecorder.cpp
 * @brief Implementation of the check tally and verdict resolution.
 */

#include "src/report/inc/CheckRecorder.hpp"

#include <utility>

#include <fmt/core.h>

namespace awgcheck {

namespace report {

/* ----------------------------- toString ----------------------------- */

const char* toString(Severity severity) noexcept {
  switch (severity) {
  case Severity::OK:
    return "ok";
  case Severity::WARN:
    return "warn";
  case Severity::BAD:
    return "bad";
  }
  return "unknown";
}

const char* toString(VerdictKind kind) noexcept {
  switch (kind) {
  case VerdictKind::ALL_CLEAR:
    return "all clear";
  case VerdictKind::WARNINGS:
    return "warnings present";
  case VerdictKind::ERRORS:
    return "errors present";
  }
  return "unknown";
}

/* ----------------------------- Verdict ----------------------------- */

std::string Verdict::summary() const {
  switch (kind) {
  case VerdictKind::ERRORS:
    return fmt::format("errors: {}; warnings: {}; total checks: {}", badCount, warnCount,
                       total());
  case VerdictKind::WARNINGS:
    return fmt::format("warnings: {}; errors: 0; total checks: {}", warnCount, total());
  case VerdictKind::ALL_CLEAR:
    break;
  }
  return fmt::format("total checks: {}", total());
}

Verdict resolveVerdict(std::uint32_t ok, std::uint32_t warn, std::uint32_t bad) noexcept {
  Verdict verdict;
  verdict.okCount = ok;
  verdict.warnCount = warn;
  verdict.badCount = bad;

  if (bad > 0) {
    verdict.kind = VerdictKind::ERRORS;
    verdict.exitCode = 1;
  } else if (warn > 0) {
    verdict.kind = VerdictKind::WARNINGS;
    verdict.exitCode = 0;
  } else {
    verdict.kind = VerdictKind::ALL_CLEAR;
    verdict.exitCode = 0;
  }
  return verdict;
}

/* ----------------------------- CheckRecorder ----------------------------- */

void CheckRecorder::record(Severity severity, std::string message) {
  switch (severity) {
  case Severity::OK:
    ++okCount_;
    break;
  case Severity::WARN:
    ++warnCount_;
    break;
  case Severity::BAD:
    ++badCount_;
    break;
  }
  lines_.push_back(ReportLine{LineKind::RESULT, severity, std::move(message)});
}

void CheckRecorder::note(std::string text) {
  lines_.push_back(ReportLine{LineKind::NOTE, Severity::OK, std::move(text)});
}

void CheckRecorder::section(std::string title) {
  lines_.push_back(ReportLine{LineKind::SECTION, Severity::OK, std::move(title)});
}

Verdict CheckRecorder::finalize() const noexcept {
  return resolveVerdict(okCount_, warnCount_, badCount_);
}

} // namespace report

} // namespace awgcheck
