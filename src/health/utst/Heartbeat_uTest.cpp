/**
 * @file Heartbeat_uTest.cpp
 * @brief Unit tests for the heartbeat freshness rule.
 */

#include "src/health/inc/Heartbeat.hpp"

#include <gtest/gtest.h>

#include <optional>

using awgcheck::health::classifyHeartbeat;
using awgcheck::health::HEARTBEAT_STALE_SECONDS;
using awgcheck::health::heartbeatMessage;
using awgcheck::report::Severity;

/** @test Boundaries of the fresh window. */
TEST(HeartbeatTest, FreshWindow) {
  EXPECT_EQ(classifyHeartbeat(0), Severity::OK);
  EXPECT_EQ(classifyHeartbeat(HEARTBEAT_STALE_SECONDS - 1), Severity::OK);
  EXPECT_EQ(classifyHeartbeat(HEARTBEAT_STALE_SECONDS), Severity::WARN);
  EXPECT_EQ(classifyHeartbeat(86400), Severity::WARN);
}

/** @test Missing or negative age is bad. */
TEST(HeartbeatTest, MissingOrNegative) {
  EXPECT_EQ(classifyHeartbeat(std::nullopt), Severity::BAD);
  EXPECT_EQ(classifyHeartbeat(-1), Severity::BAD);
}

/** @test Messages use the compact duration form. */
TEST(HeartbeatTest, Messages) {
  EXPECT_EQ(heartbeatMessage(45), "heartbeat OK (45s)");
  EXPECT_EQ(heartbeatMessage(125), "heartbeat stale (2m 5s)");
  EXPECT_EQ(heartbeatMessage(3780), "heartbeat stale (1h 3m)");
  EXPECT_EQ(heartbeatMessage(std::nullopt), "heartbeat not found");
  EXPECT_EQ(heartbeatMessage(-5), "heartbeat not found");
}
