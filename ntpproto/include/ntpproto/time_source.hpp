// Copyright (c) 2025 <Your Name>
/**
 * @file time_source.hpp
 * @brief Local clock collaborator interface (read, step, slew).
 */
#pragma once

#include "ntpproto/time_spec.hpp"

namespace ntpproto {

/**
 * Interface for the clock being disciplined.
 *
 * The synchronization engine reads time through NowUnix() and is the only
 * caller of StepTime() and SlewFrequency().
 */
class TimeSource {
 public:
  virtual ~TimeSource() = default;

  /** Returns the current time since the UNIX epoch. */
  virtual TimeSpec NowUnix() = 0;

  /**
   * @brief Apply a discontinuous correction.
   *
   * @param offset_s Signed seconds to add to the current time.
   * @return true if the clock accepted the step.
   */
  virtual bool StepTime(double offset_s) = 0;

  /**
   * @brief Set the frequency correction relative to the nominal rate.
   *
   * Positive values make the clock run faster. The value replaces any
   * previous correction; it does not accumulate.
   *
   * @param ppm Correction in parts per million.
   * @return true if the clock accepted the rate.
   */
  virtual bool SlewFrequency(double ppm) = 0;

  /** Returns the frequency correction currently in effect (ppm). */
  virtual double GetFrequencyPpm() const { return 0.0; }
};

}  // namespace ntpproto
