/**
 * @file CheckRecorder_uTest.cpp
 * @brief Unit tests for awgcheck::report::CheckRecorder and verdict resolution.
 *
 * Notes:
 *  - The exit-code property is checked over a grid of (ok, warn, bad) triples
 *    and a seeded random sample.
 */

#include "src/report/inc/CheckRecorder.hpp"

#include <gtest/gtest.h>

#include <random>
#include <string>

using awgcheck::report::CheckRecorder;
using awgcheck::report::LineKind;
using awgcheck::report::resolveVerdict;
using awgcheck::report::Severity;
using awgcheck::report::toString;
using awgcheck::report::Verdict;
using awgcheck::report::VerdictKind;

/* ----------------------------- Default State ----------------------------- */

/** @test Fresh recorder is empty and all clear. */
TEST(CheckRecorderDefaultTest, FreshRecorderIsAllClear) {
  const CheckRecorder REC;
  EXPECT_EQ(REC.okCount(), 0U);
  EXPECT_EQ(REC.warnCount(), 0U);
  EXPECT_EQ(REC.badCount(), 0U);
  EXPECT_TRUE(REC.lines().empty());

  const Verdict V = REC.finalize();
  EXPECT_EQ(V.kind, VerdictKind::ALL_CLEAR);
  EXPECT_EQ(V.exitCode, 0);
  EXPECT_EQ(V.total(), 0U);
}

/* ----------------------------- Recording ----------------------------- */

/** @test Each severity bumps exactly its own counter. */
TEST(CheckRecorderTest, RecordBumpsMatchingCounter) {
  CheckRecorder rec;
  rec.ok("a");
  rec.warn("b");
  rec.bad("c");
  rec.record(Severity::OK, "d");

  EXPECT_EQ(rec.okCount(), 2U);
  EXPECT_EQ(rec.warnCount(), 1U);
  EXPECT_EQ(rec.badCount(), 1U);
  ASSERT_EQ(rec.lines().size(), 4U);
  EXPECT_EQ(rec.lines()[1].kind, LineKind::RESULT);
  EXPECT_EQ(rec.lines()[1].severity, Severity::WARN);
  EXPECT_EQ(rec.lines()[1].text, "b");
}

/** @test Notes and sections are kept in order but never counted. */
TEST(CheckRecorderTest, NotesAreNotCounted) {
  CheckRecorder rec;
  rec.section("Resources");
  rec.note("awgbot CPU 1%");
  rec.ok("x");

  EXPECT_EQ(rec.okCount() + rec.warnCount() + rec.badCount(), 1U);
  ASSERT_EQ(rec.lines().size(), 3U);
  EXPECT_EQ(rec.lines()[0].kind, LineKind::SECTION);
  EXPECT_EQ(rec.lines()[1].kind, LineKind::NOTE);
  EXPECT_EQ(rec.lines()[2].kind, LineKind::RESULT);
  EXPECT_EQ(rec.finalize().total(), 1U);
}

/* ----------------------------- Verdict ----------------------------- */

/** @test One bad and two warnings: exit 1, summary reports both counts. */
TEST(VerdictTest, OneErrorTwoWarnings) {
  CheckRecorder rec;
  rec.ok("compose");
  rec.warn("stale heartbeat");
  rec.bad("secret missing");
  rec.warn("loose mode");

  const Verdict V = rec.finalize();
  EXPECT_EQ(V.kind, VerdictKind::ERRORS);
  EXPECT_EQ(V.exitCode, 1);
  EXPECT_EQ(V.badCount, 1U);
  EXPECT_EQ(V.warnCount, 2U);
  EXPECT_EQ(V.summary(), "errors: 1; warnings: 2; total checks: 4");
}

/** @test Warnings only: exit 0. */
TEST(VerdictTest, WarningsOnly) {
  const Verdict V = resolveVerdict(3, 2, 0);
  EXPECT_EQ(V.kind, VerdictKind::WARNINGS);
  EXPECT_EQ(V.exitCode, 0);
  EXPECT_EQ(V.summary(), "warnings: 2; errors: 0; total checks: 5");
}

/** @test Nothing but passes: all clear. */
TEST(VerdictTest, AllClear) {
  const Verdict V = resolveVerdict(7, 0, 0);
  EXPECT_EQ(V.kind, VerdictKind::ALL_CLEAR);
  EXPECT_EQ(V.exitCode, 0);
  EXPECT_EQ(V.summary(), "total checks: 7");
}

/** @test finalize() is idempotent. */
TEST(VerdictTest, FinalizeIsIdempotent) {
  CheckRecorder rec;
  rec.warn("a");
  rec.bad("b");
  const Verdict FIRST = rec.finalize();
  const Verdict SECOND = rec.finalize();
  EXPECT_EQ(FIRST.kind, SECOND.kind);
  EXPECT_EQ(FIRST.exitCode, SECOND.exitCode);
  EXPECT_EQ(FIRST.total(), SECOND.total());
}

/** @test Exit code is 1 iff bad > 0, independent of ok/warn (grid). */
TEST(VerdictTest, ExitCodeOnlyDependsOnBadGrid) {
  for (std::uint32_t ok = 0; ok < 6; ++ok) {
    for (std::uint32_t warn = 0; warn < 6; ++warn) {
      for (std::uint32_t bad = 0; bad < 6; ++bad) {
        const Verdict V = resolveVerdict(ok, warn, bad);
        EXPECT_EQ(V.exitCode, bad > 0 ? 1 : 0) << ok << "/" << warn << "/" << bad;
        EXPECT_EQ(V.total(), ok + warn + bad);
      }
    }
  }
}

/** @test Exit code is 1 iff bad > 0 for arbitrary large triples. */
TEST(VerdictTest, ExitCodeOnlyDependsOnBadRandom) {
  std::mt19937 rng(20261019U);
  std::uniform_int_distribution<std::uint32_t> dist(0, 100000);
  for (int i = 0; i < 1000; ++i) {
    const std::uint32_t OK = dist(rng);
    const std::uint32_t WARN = dist(rng);
    const std::uint32_t BAD = (i % 3 == 0) ? 0U : dist(rng);
    const Verdict V = resolveVerdict(OK, WARN, BAD);
    EXPECT_EQ(V.exitCode == 1, BAD > 0);
    EXPECT_EQ(V.kind == VerdictKind::ERRORS, BAD > 0);
    EXPECT_EQ(V.kind == VerdictKind::WARNINGS, BAD == 0 && WARN > 0);
  }
}

/** @test Recorder verdict matches the free function. */
TEST(VerdictTest, RecorderMatchesFreeFunction) {
  CheckRecorder rec;
  rec.ok("a");
  rec.ok("b");
  rec.warn("c");
  const Verdict A = rec.finalize();
  const Verdict B = resolveVerdict(2, 1, 0);
  EXPECT_EQ(A.kind, B.kind);
  EXPECT_EQ(A.exitCode, B.exitCode);
  EXPECT_EQ(A.summary(), B.summary());
}

/* ----------------------------- toString ----------------------------- */

/** @test toString covers severities and verdict kinds. */
TEST(ReportToStringTest, CoversAllValues) {
  EXPECT_STREQ(toString(Severity::OK), "ok");
  EXPECT_STREQ(toString(Severity::WARN), "warn");
  EXPECT_STREQ(toString(Severity::BAD), "bad");
  EXPECT_STREQ(toString(VerdictKind::ALL_CLEAR), "all clear");
  EXPECT_STREQ(toString(VerdictKind::WARNINGS), "warnings present");
  EXPECT_STREQ(toString(VerdictKind::ERRORS), "errors present");
}

/** @test Severity ordering is OK < WARN < BAD. */
TEST(ReportToStringTest, SeverityOrdering) {
  EXPECT_LT(Severity::OK, Severity::WARN);
  EXPECT_LT(Severity::WARN, Severity::BAD);
}
