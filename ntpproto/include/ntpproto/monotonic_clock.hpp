// Copyright (c) 2025
/**
 * @file monotonic_clock.hpp
 * @brief Application-local disciplined clock on top of CLOCK_MONOTONIC.
 *
 * The clock starts at CLOCK_REALTIME and then advances with CLOCK_MONOTONIC
 * scaled by (1 + ppm * 1e-6). Steps and frequency changes re-anchor the
 * clock; the operating system clock is never modified.
 */
#pragma once

#include <memory>

#include "ntpproto/export.hpp"
#include "ntpproto/time_source.hpp"

namespace ntpproto {

/**
 * @brief TimeSource backed by POSIX clock_gettime().
 *
 * Thread-safe: All methods use internal locking.
 */
class NTPPROTO_API MonotonicClock : public TimeSource {
 public:
  MonotonicClock();
  ~MonotonicClock() override;

  // Non-copyable, non-movable
  MonotonicClock(const MonotonicClock&) = delete;
  MonotonicClock& operator=(const MonotonicClock&) = delete;
  MonotonicClock(MonotonicClock&&) = delete;
  MonotonicClock& operator=(MonotonicClock&&) = delete;

  // TimeSource interface implementation
  TimeSpec NowUnix() override;
  bool StepTime(double offset_s) override;
  bool SlewFrequency(double ppm) override;
  double GetFrequencyPpm() const override;

  /** Re-anchor to CLOCK_REALTIME with zero frequency correction. */
  void ResetToRealTime();

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace ntpproto
