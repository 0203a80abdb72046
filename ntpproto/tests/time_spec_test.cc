// Copyright (c) 2025 <Your Name>
/**
 * @test TimeSpec basic operations
 * @brief Test TimeSpec normalization, signed intervals, and NTP conversion.
 */
#include "ntpproto/time_spec.hpp"

#include <gtest/gtest.h>

#include <cstdint>

#include "ntpproto/ntp_packet.hpp"

using ntpproto::TimeSpec;

TEST(TimeSpecTest, Normalization) {
  TimeSpec t(1, 1500000000u);  // 1.5 billion nsec = 1.5 sec overflow
  t.Normalize();
  EXPECT_EQ(t.sec, 2);
  EXPECT_EQ(t.nsec, 500000000u);
}

TEST(TimeSpecTest, SubtractionBorrowsIntoNegativeSeconds) {
  TimeSpec a(10, 300000000u);  // 10.3 sec
  TimeSpec b(10, 500000000u);  // 10.5 sec
  TimeSpec c = a - b;
  EXPECT_EQ(c.sec, -1);
  EXPECT_EQ(c.nsec, 800000000u);  // -0.2 = -1 + 0.8
  EXPECT_NEAR(c.ToDouble(), -0.2, 1e-12);
}

TEST(TimeSpecTest, FromDoubleFloorsNegativeValues) {
  TimeSpec t = TimeSpec::FromDouble(-0.25);
  EXPECT_EQ(t.sec, -1);
  EXPECT_EQ(t.nsec, 750000000u);
}

/**
 * @test TimeSpecTest.DiffSecondsKeepsNanosecondsFarFromEpoch
 * @brief DiffSeconds must not lose resolution for large absolute values.
 *
 * @steps
 * 1. Take two instants 1 ns apart around 2025.
 *
 * @expected The difference is 1e-9 within 1e-15.
 */
TEST(TimeSpecTest, DiffSecondsKeepsNanosecondsFarFromEpoch) {
  TimeSpec a(1735689600, 1);
  TimeSpec b(1735689600, 0);
  EXPECT_NEAR(ntpproto::DiffSeconds(a, b), 1e-9, 1e-15);
  EXPECT_NEAR(ntpproto::DiffSeconds(b, a), -1e-9, 1e-15);
}

TEST(TimeSpecTest, AddSecondsSigned) {
  TimeSpec t(100, 100000000u);
  TimeSpec fwd = ntpproto::AddSeconds(t, 0.25);
  EXPECT_EQ(fwd.sec, 100);
  EXPECT_EQ(fwd.nsec, 350000000u);

  TimeSpec back = ntpproto::AddSeconds(t, -0.25);
  EXPECT_EQ(back.sec, 99);
  EXPECT_EQ(back.nsec, 850000000u);
}

TEST(TimeSpecTest, Comparison) {
  TimeSpec a(10, 500000000u);
  TimeSpec c(10, 600000000u);
  TimeSpec d(11, 0u);
  EXPECT_LT(a, c);
  EXPECT_LT(c, d);
  EXPECT_GE(d, a);
  EXPECT_EQ(a, TimeSpec(10, 500000000u));
}

/**
 * @test TimeSpecTest.NtpTimestampConversion
 * @brief Conversion to 32.32 NTP format shifts the epoch and keeps ns.
 *
 * @steps
 * 1. Convert 2025-01-01 00:00:00.123456789 UTC to NTP and back.
 *
 * @expected Seconds field is offset by 2208988800; nanoseconds survive.
 */
TEST(TimeSpecTest, NtpTimestampConversion) {
  TimeSpec a(1735689600, 123456789u);
  uint64_t ntp = a.ToNtpTimestamp();
  EXPECT_EQ(ntp >> 32, 1735689600ULL + ntpproto::kNtpUnixEpochDiff);

  TimeSpec b = TimeSpec::FromNtpTimestamp(ntp);
  EXPECT_EQ(b, a);
}

TEST(TimeSpecTest, NtpFractionHalfSecond) {
  TimeSpec a(0, 500000000u);
  EXPECT_EQ(a.ToNtpTimestamp() & 0xFFFFFFFFULL, 0x80000000ULL);
}
