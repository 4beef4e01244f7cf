/**
 * @file ReportPrinter.cpp
 * @brief Implementation of human and JSON report rendering.
 */

#include "src/report/inc/ReportPrinter.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <iterator>

#include <fmt/core.h>
#include <fmt/format.h>

namespace awgcheck {

namespace report {

namespace {

using awgcheck::helpers::strings::jsonEscape;

constexpr const char* RESET = "\033[0m";
constexpr const char* DIM = "\033[2m";
constexpr const char* CYAN = "\033[36m";
constexpr const char* RULE = "────────────────────────────────────────────────────────";

const char* verdictColor(VerdictKind kind) noexcept {
  switch (kind) {
  case VerdictKind::ERRORS:
    return severityColor(Severity::BAD);
  case VerdictKind::WARNINGS:
    return severityColor(Severity::WARN);
  case VerdictKind::ALL_CLEAR:
    break;
  }
  return severityColor(Severity::OK);
}

Severity verdictSeverity(VerdictKind kind) noexcept {
  switch (kind) {
  case VerdictKind::ERRORS:
    return Severity::BAD;
  case VerdictKind::WARNINGS:
    return Severity::WARN;
  case VerdictKind::ALL_CLEAR:
    break;
  }
  return Severity::OK;
}

} // namespace

/* ----------------------------- Glyphs ----------------------------- */

const char* severityGlyph(Severity severity) noexcept {
  switch (severity) {
  case Severity::OK:
    return "✔";
  case Severity::WARN:
    return "▲";
  case Severity::BAD:
    return "✖";
  }
  return "?";
}

const char* severityColor(Severity severity) noexcept {
  switch (severity) {
  case Severity::OK:
    return "\033[32m"; // Green
  case Severity::WARN:
    return "\033[33m"; // Yellow
  case Severity::BAD:
    return "\033[31m"; // Red
  }
  return RESET;
}

/* ----------------------------- Human Output ----------------------------- */

std::string formatHumanReport(const ReportHeader& header, const CheckRecorder& recorder,
                              const Verdict& verdict, bool color) {
  const auto paint = [color](const char* code) { return color ? code : ""; };

  std::string out;
  auto it = std::back_inserter(out);

  fmt::format_to(it, "{}{}{}\n", paint(DIM), RULE, paint(RESET));
  fmt::format_to(it, "{}{}{}{}\n", paint(CYAN), header.title, header.full ? " (full)" : "",
                 paint(RESET));
  if (!header.timestamp.empty()) {
    fmt::format_to(it, "{}\n", header.timestamp);
  }
  fmt::format_to(it, "{}{}{}\n", paint(DIM), RULE, paint(RESET));

  for (const ReportLine& LINE : recorder.lines()) {
    switch (LINE.kind) {
    case LineKind::RESULT:
      fmt::format_to(it, "{}{}{} {}\n", paint(severityColor(LINE.severity)),
                     severityGlyph(LINE.severity), paint(RESET), LINE.text);
      break;
    case LineKind::NOTE:
      fmt::format_to(it, "   {}\n", LINE.text);
      break;
    case LineKind::SECTION:
      fmt::format_to(it, "{}{}{}\n", paint(DIM), RULE, paint(RESET));
      fmt::format_to(it, "{}{}{}\n", paint(CYAN), LINE.text, paint(RESET));
      break;
    }
  }

  fmt::format_to(it, "{}{}{}\n\n", paint(DIM), RULE, paint(RESET));
  fmt::format_to(it, "{}{} Verdict: {}{} ({})\n", paint(verdictColor(verdict.kind)),
                 severityGlyph(verdictSeverity(verdict.kind)), toString(verdict.kind),
                 paint(RESET), verdict.summary());
  return out;
}

/* ----------------------------- JSON Output ----------------------------- */

std::string formatJsonReport(const ReportHeader& header, const CheckRecorder& recorder,
                             const Verdict& verdict) {
  std::string out;
  auto it = std::back_inserter(out);

  fmt::format_to(it, "{{\n");
  fmt::format_to(it, "  \"title\": \"{}\",\n", jsonEscape(header.title));
  fmt::format_to(it, "  \"full\": {},\n", header.full ? "true" : "false");
  fmt::format_to(it, "  \"timestamp\": \"{}\",\n", jsonEscape(header.timestamp));

  // Checks and notes, each in run order
  std::string checks;
  std::string notes;
  std::string section;
  for (const ReportLine& LINE : recorder.lines()) {
    switch (LINE.kind) {
    case LineKind::RESULT:
      fmt::format_to(std::back_inserter(checks),
                     "{}    {{\"severity\": \"{}\", \"message\": \"{}\"}}",
                     checks.empty() ? "" : ",\n", toString(LINE.severity), jsonEscape(LINE.text));
      break;
    case LineKind::NOTE:
      fmt::format_to(std::back_inserter(notes), "{}    {{\"section\": \"{}\", \"text\": \"{}\"}}",
                     notes.empty() ? "" : ",\n", jsonEscape(section), jsonEscape(LINE.text));
      break;
    case LineKind::SECTION:
      section = LINE.text;
      break;
    }
  }

  fmt::format_to(it, "  \"checks\": [\n{}{}  ],\n", checks, checks.empty() ? "" : "\n");
  fmt::format_to(it, "  \"notes\": [\n{}{}  ],\n", notes, notes.empty() ? "" : "\n");

  fmt::format_to(it, "  \"summary\": {{\n");
  fmt::format_to(it, "    \"ok\": {},\n", verdict.okCount);
  fmt::format_to(it, "    \"warn\": {},\n", verdict.warnCount);
  fmt::format_to(it, "    \"bad\": {},\n", verdict.badCount);
  fmt::format_to(it, "    \"total\": {}\n", verdict.total());
  fmt::format_to(it, "  }},\n");

  fmt::format_to(it, "  \"verdict\": \"{}\",\n", toString(verdict.kind));
  fmt::format_to(it, "  \"exitCode\": {}\n", verdict.exitCode);
  fmt::format_to(it, "}}\n");
  return out;
}

} // namespace report

} // namespace awgcheck
