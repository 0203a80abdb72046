// Copyright (c) 2025 The NTP Sample Authors
/**
 * @file types.cc
 * @brief Sample construction and dispersion aging.
 */
#include "ntpsync/types.hpp"

#include <algorithm>
#include <cmath>

namespace ntpsync {

bool MakeSample(const ntpproto::TimeSpec& t1, const ntpproto::TimeSpec& t2,
                const ntpproto::TimeSpec& t3, const ntpproto::TimeSpec& t4,
                const ntpproto::NtpHeader& response, double local_precision,
                Sample* out) {
  if (out == nullptr) return false;

  // delay = (T4 - T1) - (T3 - T2)
  ntpproto::TimeSpec delay = (t4 - t1) - (t3 - t2);
  // offset = ((T2 - T1) + (T3 - T4)) / 2
  ntpproto::TimeSpec offset_2x = (t2 - t1) + (t3 - t4);

  Sample s;
  s.t1 = t1;
  s.t2 = t2;
  s.t3 = t3;
  s.t4 = t4;
  s.delay = delay.ToDouble();
  s.offset = offset_2x.ToDouble() / 2.0;
  s.root_delay = response.root_delay;
  s.root_dispersion = response.root_dispersion;
  s.precision = ntpproto::Log2ToSeconds(response.precision);
  s.dispersion =
      s.precision + local_precision + kPhi * std::max(0.0, s.delay);
  s.stratum = response.stratum;
  s.leap = response.leap;

  if (!std::isfinite(s.delay) || !std::isfinite(s.offset) ||
      !std::isfinite(s.root_delay) || !std::isfinite(s.root_dispersion) ||
      !std::isfinite(s.dispersion)) {
    return false;
  }

  *out = s;
  return true;
}

FilteredStat AgeFilteredStat(const FilteredStat& stat,
                             const ntpproto::TimeSpec& now) {
  FilteredStat aged = stat;
  double age = std::max(0.0, ntpproto::DiffSeconds(now, stat.update_time));
  aged.root_dispersion += kPhi * age;
  aged.dispersion += kPhi * age;
  return aged;
}

}  // namespace ntpsync
