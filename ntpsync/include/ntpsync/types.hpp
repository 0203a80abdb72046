// Copyright (c) 2025 <Your Name>
/**
 * @file types.hpp
 * @brief Measurement and statistics records passed between engine stages.
 *
 * All offsets, delays, dispersions and jitters are in seconds (double).
 * Offsets are "source minus local": positive means the local clock is
 * behind.
 */
#pragma once

#include <cstdint>

#include "ntpproto/ntp_packet.hpp"
#include "ntpproto/time_spec.hpp"

namespace ntpsync {

/** @brief Stable source identifier; assigned once and never reused. */
using SourceId = uint32_t;

/** @brief Frequency tolerance used to age dispersion (15 ppm). */
constexpr double kPhi = 15e-6;

/** @brief Dispersion assigned to empty filter slots (seconds). */
constexpr double kMaxDispersion = 16.0;

/** @brief Stratum at or above which a source is unsynchronized. */
constexpr int kMaxStratum = 16;

/**
 * @brief One timestamped measurement from a single exchange.
 *
 * Built only by MakeSample() and never modified afterwards.
 */
struct Sample {
  ntpproto::TimeSpec t1;  ///< Origin: local transmit time
  ntpproto::TimeSpec t2;  ///< Source receive time
  ntpproto::TimeSpec t3;  ///< Source transmit time
  ntpproto::TimeSpec t4;  ///< Destination: local receive time
  double delay = 0.0;
  double offset = 0.0;
  double root_delay = 0.0;       ///< Reported by the source
  double root_dispersion = 0.0;  ///< Reported by the source
  double precision = 0.0;        ///< Source precision (seconds)
  double dispersion = 0.0;       ///< Own error bound of this measurement
  uint8_t stratum = 0;
  ntpproto::LeapIndicator leap = ntpproto::LeapIndicator::NoWarning;
};

/**
 * @brief Derive a Sample from four timestamps and the response header.
 *
 * delay  = (t4 - t1) - (t3 - t2)
 * offset = ((t2 - t1) + (t3 - t4)) / 2
 * dispersion = precision_remote + precision_local + kPhi * delay
 *
 * @param local_precision Local clock precision in seconds.
 * @param out Filled on success.
 * @return false if any derived value is not finite.
 */
bool MakeSample(const ntpproto::TimeSpec& t1, const ntpproto::TimeSpec& t2,
                const ntpproto::TimeSpec& t3, const ntpproto::TimeSpec& t4,
                const ntpproto::NtpHeader& response, double local_precision,
                Sample* out);

/**
 * @brief Per-source estimate produced by the clock filter.
 *
 * `dispersion` is the source's maximum error bound (synchronization
 * distance): root_delay / 2 + root_dispersion. It is the half-width of the
 * correctness interval used by selection.
 */
struct FilteredStat {
  double offset = 0.0;
  double delay = 0.0;
  double dispersion = 0.0;
  double jitter = 0.0;
  double root_delay = 0.0;       ///< Source root delay + delay
  double root_dispersion = 0.0;  ///< Source root dispersion + filter eps
  uint8_t stratum = 0;
  ntpproto::LeapIndicator leap = ntpproto::LeapIndicator::NoWarning;
  ntpproto::TimeSpec time;         ///< Capture time of the selected sample
  ntpproto::TimeSpec update_time;  ///< Instant the stat was last refreshed
};

/**
 * @brief Grow dispersion by kPhi per second since the last refresh.
 *
 * Non-decreasing in `now`; instants before update_time age by zero.
 */
FilteredStat AgeFilteredStat(const FilteredStat& stat,
                             const ntpproto::TimeSpec& now);

/** @brief System-wide estimate from one synchronization round. */
struct SystemStat {
  double offset = 0.0;
  double jitter = 0.0;  ///< Weighted spread across survivors
  uint8_t stratum = kMaxStratum;
  ntpproto::LeapIndicator leap = ntpproto::LeapIndicator::Unsynchronized;
  bool synchronized = false;

  double root_delay = 0.0;       ///< From the system peer
  double root_dispersion = 0.0;  ///< From the system peer
  double peer_jitter = 0.0;      ///< System peer's own filter jitter
  SourceId system_peer = 0;
  int truechimers = 0;
  int survivors = 0;
  ntpproto::TimeSpec update_time;
};

}  // namespace ntpsync
