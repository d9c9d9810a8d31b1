#include "stepflow/util/backoff.hpp"

#include "gtest/gtest.h"

using namespace stepflow;
using namespace std::chrono_literals;

TEST(ExponentialBackoffTest, DoublesFromBaseUntilCap) {
  ExponentialBackoff backoff({.initial = 100ms, .max = 1000ms});
  EXPECT_EQ(backoff.delay_for(0), 100ms);
  EXPECT_EQ(backoff.delay_for(1), 200ms);
  EXPECT_EQ(backoff.delay_for(2), 400ms);
  EXPECT_EQ(backoff.delay_for(3), 800ms);
  EXPECT_EQ(backoff.delay_for(4), 1000ms);
  EXPECT_EQ(backoff.delay_for(40), 1000ms);
}

TEST(ExponentialBackoffTest, DefaultsMatchStepDefaults) {
  ExponentialBackoff backoff;
  EXPECT_EQ(backoff.delay_for(0), 1s);
  EXPECT_EQ(backoff.delay_for(5), 32s);
  EXPECT_EQ(backoff.delay_for(6), 60s);
}

TEST(ExponentialBackoffTest, BaseAboveCapIsClamped) {
  ExponentialBackoff backoff({.initial = 5s, .max = 2s});
  EXPECT_EQ(backoff.delay_for(0), 2s);
}

TEST(ExponentialBackoffTest, ZeroBaseNeverWaits) {
  ExponentialBackoff backoff({.initial = 0ms, .max = 1s});
  EXPECT_EQ(backoff.delay_for(0), 0ms);
  EXPECT_EQ(backoff.delay_for(3), 0ms);
}

TEST(ExponentialBackoffTest, CallOperatorAdvancesAndResets) {
  ExponentialBackoff backoff({.initial = 10ms, .max = 1s});
  EXPECT_EQ(backoff(), 10ms);
  EXPECT_EQ(backoff(), 20ms);
  EXPECT_EQ(backoff(), 40ms);
  EXPECT_EQ(backoff.attempts(), 3);
  backoff.reset();
  EXPECT_EQ(backoff.attempts(), 0);
  EXPECT_EQ(backoff(), 10ms);
}
