// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Tests for the sample window and clock filter.
 */
#include "ntpsync/clock_filter.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "test_support.hpp"

using ntpproto::TimeSpec;
using ntpsync::ClockFilter;
using ntpsync::FilteredStat;
using ntpsync::SampleWindow;
using ntpsync_test::MakeTestSample;

namespace {

const TimeSpec kT0(1735689600, 0);
constexpr double kPrecision = 1e-6;

TimeSpec At(double seconds) { return ntpproto::AddSeconds(kT0, seconds); }

}  // namespace

TEST(SampleWindowTest, EvictsOldestAndNeverExceedsCapacity) {
  SampleWindow w(3);
  for (int i = 0; i < 5; ++i) w.Push(MakeTestSample(At(i), i * 0.001, 0.01));
  ASSERT_EQ(w.size(), 3u);
  EXPECT_EQ(w.capacity(), 3u);
  EXPECT_DOUBLE_EQ(w.At(0).offset, 0.002);  // oldest kept
  EXPECT_DOUBLE_EQ(w.Newest().offset, 0.004);

  w.Clear();
  EXPECT_TRUE(w.empty());
}

/**
 * @test ClockFilterTest.SelectsMinimumDelay
 * @brief The representative sample is the one with the smallest delay.
 *
 * @steps
 * 1. Feed 8 samples; delays 5,3,8,2,6,7,4,9 ms and offsets 1..8 ms.
 *
 * @expected Offset/delay come from the 2 ms sample (offset 4 ms). Jitter is
 *           the RMS of the other offsets about 4 ms.
 */
TEST(ClockFilterTest, SelectsMinimumDelay) {
  ClockFilter filter(8, kPrecision);
  const double delays[] = {5, 3, 8, 2, 6, 7, 4, 9};
  FilteredStat stat;
  for (int i = 0; i < 8; ++i) {
    filter.Add(MakeTestSample(At(i), (i + 1) * 1e-3, delays[i] * 1e-3),
               &stat);
  }
  EXPECT_DOUBLE_EQ(stat.offset, 0.004);
  EXPECT_DOUBLE_EQ(stat.delay, 0.002);
  EXPECT_EQ(stat.time, At(3));
  EXPECT_EQ(stat.update_time, At(7));

  // (1,2,3,5,6,7,8) - 4 -> squares 9,4,1,1,4,9,16 = 44 (ms^2)
  EXPECT_NEAR(stat.jitter, std::sqrt(44.0 / 7.0) * 1e-3, 1e-12);
}

TEST(ClockFilterTest, EvictionDropsOldBest) {
  ClockFilter filter(4, kPrecision);
  FilteredStat stat;
  filter.Add(MakeTestSample(At(0), 0.001, 0.001), &stat);  // best, will leave
  for (int i = 1; i <= 4; ++i) {
    filter.Add(MakeTestSample(At(i), 0.005, 0.010 + i * 0.001), &stat);
  }
  EXPECT_EQ(filter.window().size(), 4u);
  EXPECT_DOUBLE_EQ(stat.delay, 0.011);
  EXPECT_DOUBLE_EQ(stat.offset, 0.005);
}

TEST(ClockFilterTest, EqualDelayPrefersNewer) {
  ClockFilter filter(8, kPrecision);
  FilteredStat stat;
  filter.Add(MakeTestSample(At(0), 0.001, 0.010), &stat);
  filter.Add(MakeTestSample(At(1), 0.002, 0.010), &stat);
  EXPECT_DOUBLE_EQ(stat.offset, 0.002);
}

/**
 * @test ClockFilterTest.FreshnessFollowsRepresentative
 * @brief Add() reports fresh only when the representative sample changed
 *        to a newer one.
 *
 * @steps
 * 1. Add a low-delay sample, then a higher-delay one, then a lower one.
 *
 * @expected fresh, not fresh, fresh.
 */
TEST(ClockFilterTest, FreshnessFollowsRepresentative) {
  ClockFilter filter(8, kPrecision);
  FilteredStat stat;
  EXPECT_TRUE(filter.Add(MakeTestSample(At(0), 0.001, 0.005), &stat));
  EXPECT_FALSE(filter.Add(MakeTestSample(At(1), 0.001, 0.009), &stat));
  EXPECT_TRUE(filter.Add(MakeTestSample(At(2), 0.001, 0.004), &stat));

  filter.Clear();
  EXPECT_TRUE(filter.Add(MakeTestSample(At(3), 0.001, 0.009), &stat));
}

TEST(ClockFilterTest, JitterFlooredAtPrecision) {
  ClockFilter filter(8, kPrecision);
  FilteredStat stat;
  filter.Add(MakeTestSample(At(0), 0.003, 0.01), &stat);
  EXPECT_DOUBLE_EQ(stat.jitter, kPrecision);
  filter.Add(MakeTestSample(At(1), 0.003, 0.01), &stat);
  EXPECT_DOUBLE_EQ(stat.jitter, kPrecision);
}

/**
 * @test ClockFilterTest.EmptySlotsWidenDispersion
 * @brief A lone sample carries kMaxDispersion for every empty slot.
 *
 * @steps
 * 1. Add one sample with dispersion d to an 8-slot filter.
 *
 * @expected root_dispersion = d/2 + 16 * (1/4 + ... + 1/256).
 */
TEST(ClockFilterTest, EmptySlotsWidenDispersion) {
  ClockFilter filter(8, kPrecision);
  FilteredStat stat;
  const double d = 0.001;
  filter.Add(MakeTestSample(At(0), 0.0, 0.02, d), &stat);
  const double expected = d / 2.0 + 16.0 * (0.5 - 1.0 / 256.0);
  EXPECT_NEAR(stat.root_dispersion, expected, 1e-12);
  EXPECT_NEAR(stat.root_delay, 0.02, 1e-12);
  EXPECT_NEAR(stat.dispersion, 0.01 + expected, 1e-12);

  // A full window is far tighter.
  for (int i = 1; i < 8; ++i) {
    filter.Add(MakeTestSample(At(i), 0.0, 0.02, d), &stat);
  }
  EXPECT_LT(stat.root_dispersion, 0.01);
}

TEST(ClockFilterTest, AgingIsMonotonic) {
  ClockFilter filter(8, kPrecision);
  FilteredStat stat;
  filter.Add(MakeTestSample(At(0), 0.0, 0.01), &stat);

  double prev = ntpsync::AgeFilteredStat(stat, At(-5)).dispersion;
  EXPECT_DOUBLE_EQ(prev, stat.dispersion);
  for (int i = 0; i < 10; ++i) {
    double cur = ntpsync::AgeFilteredStat(stat, At(i * 10.0)).dispersion;
    EXPECT_GE(cur, prev);
    prev = cur;
  }
  EXPECT_NEAR(prev - stat.dispersion, ntpsync::kPhi * 90.0, 1e-12);
}
