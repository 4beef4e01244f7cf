/**
 * @file ResourceUsage_uTest.cpp
 * @brief Unit tests for awgcheck::container resource output parsers.
 */

#include "src/container/inc/ResourceUsage.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using awgcheck::container::ContainerUsage;
using awgcheck::container::DiskUsage;
using awgcheck::container::parseDfOutput;
using awgcheck::container::parseDuKilobytes;
using awgcheck::container::parseStatsListing;

/* ----------------------------- docker stats ----------------------------- */

/** @test Four-field rows are parsed. */
TEST(ParseStatsListingTest, ParsesRows) {
  const std::vector<ContainerUsage> ROWS =
      parseStatsListing("awgbot\t0.37%\t45.2MiB / 512MiB\t8.83%\n"
                        "amnezia-awg\t1.02%\t12MiB / 1.9GiB\t0.61%\n");
  ASSERT_EQ(ROWS.size(), 2U);
  EXPECT_EQ(ROWS[0].name, "awgbot");
  EXPECT_EQ(ROWS[0].cpuPercent, "0.37%");
  EXPECT_EQ(ROWS[0].memUsage, "45.2MiB / 512MiB");
  EXPECT_EQ(ROWS[0].memPercent, "8.83%");
  EXPECT_EQ(ROWS[1].name, "amnezia-awg");
}

/** @test Rows with a wrong field count are skipped. */
TEST(ParseStatsListingTest, SkipsMalformedRows) {
  const std::vector<ContainerUsage> ROWS =
      parseStatsListing("garbage line\n"
                        "a\tb\tc\n"
                        "a\tb\tc\td\te\n"
                        "awgbot\t0.10%\t1MiB / 2MiB\t50.00%\n");
  ASSERT_EQ(ROWS.size(), 1U);
  EXPECT_EQ(ROWS[0].name, "awgbot");
}

/** @test Empty output yields no rows. */
TEST(ParseStatsListingTest, EmptyOutput) { EXPECT_TRUE(parseStatsListing("").empty()); }

/** @test Summary line contains every figure. */
TEST(ParseStatsListingTest, ToStringContainsFigures) {
  const ContainerUsage ROW{"awgbot", "0.37%", "45MiB / 512MiB", "8.8%"};
  const std::string S = ROW.toString();
  EXPECT_NE(S.find("awgbot"), std::string::npos);
  EXPECT_NE(S.find("CPU 0.37%"), std::string::npos);
  EXPECT_NE(S.find("45MiB / 512MiB"), std::string::npos);
  EXPECT_NE(S.find("(8.8%)"), std::string::npos);
}

/* ----------------------------- df ----------------------------- */

/** @test Standard single-row layout. */
TEST(ParseDfOutputTest, SingleRow) {
  const auto USAGE = parseDfOutput("Filesystem      Size  Used Avail Use% Mounted on\n"
                                   "overlay          20G  3.1G   16G  17% /\n");
  ASSERT_TRUE(USAGE.has_value());
  EXPECT_EQ(USAGE->filesystem, "overlay");
  EXPECT_EQ(USAGE->size, "20G");
  EXPECT_EQ(USAGE->used, "3.1G");
  EXPECT_EQ(USAGE->available, "16G");
  EXPECT_EQ(USAGE->usePercent, "17%");
  EXPECT_EQ(USAGE->toString(), "size: 20G; used: 3.1G; free: 16G (17%)");
}

/** @test Wrapped layout (long device name on its own line). */
TEST(ParseDfOutputTest, WrappedRow) {
  const auto USAGE = parseDfOutput("Filesystem           Size  Used Available Use% Mounted on\n"
                                   "/dev/mapper/vg0-very-long-volume-name\n"
                                   "                      50G   10G     40G  20% /app/data\n");
  ASSERT_TRUE(USAGE.has_value());
  EXPECT_EQ(USAGE->filesystem, "/dev/mapper/vg0-very-long-volume-name");
  EXPECT_EQ(USAGE->size, "50G");
  EXPECT_EQ(USAGE->usePercent, "20%");
}

/** @test Header only or empty output fails. */
TEST(ParseDfOutputTest, MissingRow) {
  EXPECT_FALSE(parseDfOutput("").has_value());
  EXPECT_FALSE(parseDfOutput("Filesystem Size Used Avail Use% Mounted on\n").has_value());
}

/* ----------------------------- du ----------------------------- */

/** @test du -sk output converts to bytes. */
TEST(ParseDuKilobytesTest, ConvertsToBytes) {
  EXPECT_EQ(parseDuKilobytes("1536\t/app/data\n"), std::optional<std::uint64_t>(1536ULL * 1024));
  EXPECT_EQ(parseDuKilobytes("0\t/app/data"), std::optional<std::uint64_t>(0));
}

/** @test Non-numeric output fails. */
TEST(ParseDuKilobytesTest, RejectsGarbage) {
  EXPECT_FALSE(parseDuKilobytes("").has_value());
  EXPECT_FALSE(parseDuKilobytes("du: /app/data: No such file").has_value());
}
