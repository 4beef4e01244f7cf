/**
 * @file ReportPrinter_uTest.cpp
 * @brief Unit tests for awgcheck::report human and JSON rendering.
 */

#include "src/report/inc/ReportPrinter.hpp"

#include <gtest/gtest.h>

#include <string>

using awgcheck::report::CheckRecorder;
using awgcheck::report::formatHumanReport;
using awgcheck::report::formatJsonReport;
using awgcheck::report::ReportHeader;
using awgcheck::report::Severity;
using awgcheck::report::severityGlyph;

namespace {

CheckRecorder sampleRun() {
  CheckRecorder rec;
  rec.ok("docker compose available");
  rec.note("secret.env: mode=600");
  rec.warn("heartbeat stale (3m)");
  rec.section("Resources");
  rec.note("awgbot CPU 1%");
  rec.bad("secret \"quoted\" missing");
  return rec;
}

std::size_t countOf(const std::string& haystack, const std::string& needle) {
  std::size_t count = 0;
  for (std::size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

} // namespace

/* ----------------------------- Human Output ----------------------------- */

/** @test Every result gets its glyph; notes are indented. */
TEST(FormatHumanReportTest, GlyphPerResult) {
  const CheckRecorder REC = sampleRun();
  const std::string OUT =
      formatHumanReport(ReportHeader{"AWGBOT quick check", false, "2026-10-19T10:00:00+00:00"},
                        REC, REC.finalize(), false);

  EXPECT_NE(OUT.find("✔ docker compose available\n"), std::string::npos);
  EXPECT_NE(OUT.find("▲ heartbeat stale (3m)\n"), std::string::npos);
  EXPECT_NE(OUT.find("   secret.env: mode=600\n"), std::string::npos);
  EXPECT_NE(OUT.find("Resources\n"), std::string::npos);
  EXPECT_NE(OUT.find("2026-10-19T10:00:00+00:00"), std::string::npos);
}

/** @test Last line is the verdict with counts. */
TEST(FormatHumanReportTest, EndsWithVerdict) {
  const CheckRecorder REC = sampleRun();
  const std::string OUT =
      formatHumanReport(ReportHeader{"T", false, ""}, REC, REC.finalize(), false);
  const std::string LAST =
      "✖ Verdict: errors present (errors: 1; warnings: 1; total checks: 3)\n";
  ASSERT_GE(OUT.size(), LAST.size());
  EXPECT_EQ(OUT.substr(OUT.size() - LAST.size()), LAST);
}

/** @test Full mode marks the title. */
TEST(FormatHumanReportTest, FullTitle) {
  const CheckRecorder REC;
  const std::string OUT = formatHumanReport(ReportHeader{"AWGBOT quick check", true, ""}, REC,
                                            REC.finalize(), false);
  EXPECT_NE(OUT.find("AWGBOT quick check (full)\n"), std::string::npos);
  EXPECT_NE(OUT.find("Verdict: all clear (total checks: 0)"), std::string::npos);
}

/** @test Color flag controls ANSI escapes. */
TEST(FormatHumanReportTest, ColorToggle) {
  const CheckRecorder REC = sampleRun();
  const std::string PLAIN =
      formatHumanReport(ReportHeader{"T", false, ""}, REC, REC.finalize(), false);
  const std::string COLORED =
      formatHumanReport(ReportHeader{"T", false, ""}, REC, REC.finalize(), true);
  EXPECT_EQ(PLAIN.find('\033'), std::string::npos);
  EXPECT_NE(COLORED.find("\033[31m"), std::string::npos);
}

/** @test Glyphs are distinct per severity. */
TEST(FormatHumanReportTest, GlyphsDistinct) {
  EXPECT_STRNE(severityGlyph(Severity::OK), severityGlyph(Severity::WARN));
  EXPECT_STRNE(severityGlyph(Severity::WARN), severityGlyph(Severity::BAD));
}

/* ----------------------------- JSON Output ----------------------------- */

/** @test JSON lists checks with severities and escapes quotes. */
TEST(FormatJsonReportTest, ChecksAndEscaping) {
  const CheckRecorder REC = sampleRun();
  const std::string OUT = formatJsonReport(ReportHeader{"T", true, "ts"}, REC, REC.finalize());

  EXPECT_EQ(countOf(OUT, "\"severity\""), 3U);
  EXPECT_NE(OUT.find("{\"severity\": \"warn\", \"message\": \"heartbeat stale (3m)\"}"),
            std::string::npos);
  EXPECT_NE(OUT.find("secret \\\"quoted\\\" missing"), std::string::npos);
  EXPECT_NE(OUT.find("\"full\": true"), std::string::npos);
}

/** @test Notes carry the section they belong to. */
TEST(FormatJsonReportTest, NotesCarrySection) {
  const CheckRecorder REC = sampleRun();
  const std::string OUT = formatJsonReport(ReportHeader{"T", false, ""}, REC, REC.finalize());
  EXPECT_NE(OUT.find("{\"section\": \"\", \"text\": \"secret.env: mode=600\"}"),
            std::string::npos);
  EXPECT_NE(OUT.find("{\"section\": \"Resources\", \"text\": \"awgbot CPU 1%\"}"),
            std::string::npos);
}

/** @test Summary block and verdict fields. */
TEST(FormatJsonReportTest, SummaryAndVerdict) {
  const CheckRecorder REC = sampleRun();
  const std::string OUT = formatJsonReport(ReportHeader{"T", false, ""}, REC, REC.finalize());
  EXPECT_NE(OUT.find("\"ok\": 1,"), std::string::npos);
  EXPECT_NE(OUT.find("\"warn\": 1,"), std::string::npos);
  EXPECT_NE(OUT.find("\"bad\": 1,"), std::string::npos);
  EXPECT_NE(OUT.find("\"total\": 3"), std::string::npos);
  EXPECT_NE(OUT.find("\"verdict\": \"errors present\""), std::string::npos);
  EXPECT_NE(OUT.find("\"exitCode\": 1"), std::string::npos);
}

/** @test Empty run renders empty arrays. */
TEST(FormatJsonReportTest, EmptyRun) {
  const CheckRecorder REC;
  const std::string OUT = formatJsonReport(ReportHeader{"T", false, ""}, REC, REC.finalize());
  EXPECT_NE(OUT.find("\"checks\": [\n  ],"), std::string::npos);
  EXPECT_NE(OUT.find("\"notes\": [\n  ],"), std::string::npos);
  EXPECT_NE(OUT.find("\"exitCode\": 0"), std::string::npos);
}
