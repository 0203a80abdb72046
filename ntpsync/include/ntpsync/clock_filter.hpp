// Copyright (c) 2025 <Your Name>
/**
 * @file clock_filter.hpp
 * @brief Per-source sample window and minimum-delay clock filter.
 */
#pragma once

#include <cstddef>
#include <vector>

#include "ntpsync/types.hpp"

namespace ntpsync {

/**
 * @brief Fixed-capacity ring buffer of the most recent samples.
 *
 * Storage is allocated once at construction; Push() is O(1) and overwrites
 * the oldest entry when the window is full.
 */
class SampleWindow {
 public:
  explicit SampleWindow(size_t capacity);

  void Push(const Sample& sample);
  void Clear();

  size_t size() const { return count_; }
  size_t capacity() const { return buf_.size(); }
  bool empty() const { return count_ == 0; }

  /** @brief i-th sample, 0 = oldest, size()-1 = newest. */
  const Sample& At(size_t i) const;
  const Sample& Newest() const { return At(count_ - 1); }

 private:
  std::vector<Sample> buf_;
  size_t head_ = 0;  ///< Index of the oldest entry
  size_t count_ = 0;
};

/**
 * @brief Reduces a source's sample window to one FilteredStat.
 *
 * The representative sample is the one with minimum delay (ties go to the
 * newer sample). Jitter is the RMS of the other offsets about the
 * representative. Filter dispersion weights each slot's aged dispersion by
 * 1/2^(i+1) in delay order, with empty slots counting as kMaxDispersion, so
 * a source with few samples carries a wide error bound.
 */
class ClockFilter {
 public:
  /**
   * @param window Window size N (at least 1).
   * @param local_precision Local clock precision; floor for jitter.
   */
  ClockFilter(size_t window, double local_precision);

  /**
   * @brief Insert a sample and recompute the filtered estimate.
   *
   * @param sample New measurement.
   * @param out Recomputed stat (always written).
   * @return true if the representative sample is newer than the one used
   *         by the previous update; a stale representative must not drive
   *         another synchronization round.
   */
  bool Add(const Sample& sample, FilteredStat* out);

  /** Drop all samples, e.g. after the local clock was stepped. */
  void Clear();

  const SampleWindow& window() const { return window_; }

 private:
  SampleWindow window_;
  double local_precision_;
  ntpproto::TimeSpec last_selected_;
  bool has_selected_ = false;
};

}  // namespace ntpsync
