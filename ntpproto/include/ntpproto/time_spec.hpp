// Copyright (c) 2025 The NTP Sample Authors
/**
 * @file time_spec.hpp
 * @brief Seconds + nanoseconds value used for instants and signed intervals.
 *
 * The nanosecond field is always in [0, 1e9); a negative interval carries
 * its sign in `sec` only, e.g. -0.2 s is stored as {-1, 800000000}.
 */
#pragma once

#include <cstdint>

#include "ntpproto/export.hpp"

namespace ntpproto {

/** @brief UNIX-epoch instant or signed interval at nanosecond resolution. */
struct NTPPROTO_API TimeSpec {
  int64_t sec;
  uint32_t nsec;

  TimeSpec() : sec(0), nsec(0) {}
  TimeSpec(int64_t s, uint32_t ns) : sec(s), nsec(ns) {}

  /** Carry whole seconds out of `nsec`. */
  void Normalize();

  double ToDouble() const;

  /**
   * @brief Split a real number of seconds into {floor, remainder}.
   *
   * The remainder is rounded to the nearest nanosecond.
   */
  static TimeSpec FromDouble(double seconds);

  /** @brief 32.32 fixed point seconds since 1900 (host order). */
  uint64_t ToNtpTimestamp() const;

  /** @brief Inverse of ToNtpTimestamp, assuming NTP era 0. */
  static TimeSpec FromNtpTimestamp(uint64_t ntp_ts);
};

inline bool operator==(const TimeSpec& a, const TimeSpec& b) {
  return a.sec == b.sec && a.nsec == b.nsec;
}
inline bool operator!=(const TimeSpec& a, const TimeSpec& b) {
  return !(a == b);
}
inline bool operator<(const TimeSpec& a, const TimeSpec& b) {
  return a.sec < b.sec || (a.sec == b.sec && a.nsec < b.nsec);
}
inline bool operator>(const TimeSpec& a, const TimeSpec& b) { return b < a; }
inline bool operator<=(const TimeSpec& a, const TimeSpec& b) {
  return !(b < a);
}
inline bool operator>=(const TimeSpec& a, const TimeSpec& b) {
  return !(a < b);
}

NTPPROTO_API TimeSpec operator+(const TimeSpec& a, const TimeSpec& b);

/** Result may be a negative interval. */
NTPPROTO_API TimeSpec operator-(const TimeSpec& a, const TimeSpec& b);

/** @brief Instant `t` moved by a signed number of seconds. */
NTPPROTO_API TimeSpec AddSeconds(const TimeSpec& t, double seconds);

/**
 * @brief a - b in seconds.
 *
 * The integer parts are subtracted before conversion so that two instants
 * in the same decade still differ by exactly 1e-9 for one nanosecond.
 */
inline double DiffSeconds(const TimeSpec& a, const TimeSpec& b) {
  const int64_t dsec = a.sec - b.sec;
  const int64_t dnsec =
      static_cast<int64_t>(a.nsec) - static_cast<int64_t>(b.nsec);
  return static_cast<double>(dsec) + static_cast<double>(dnsec) * 1e-9;
}

inline double ToSeconds(const TimeSpec& t) { return t.ToDouble(); }

}  // namespace ntpproto
