// Copyright (c) 2025 The NTP Sample Authors
/**
 * @file clock_filter.cc
 * @brief Sample window and clock filter implementation.
 */
#include "ntpsync/clock_filter.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace ntpsync {

SampleWindow::SampleWindow(size_t capacity)
    : buf_(std::max<size_t>(1, capacity)) {}

void SampleWindow::Push(const Sample& sample) {
  const size_t cap = buf_.size();
  if (count_ < cap) {
    buf_[(head_ + count_) % cap] = sample;
    ++count_;
  } else {
    // Overwrite the oldest entry; the next one becomes the oldest.
    buf_[head_] = sample;
    head_ = (head_ + 1) % cap;
  }
}

void SampleWindow::Clear() {
  head_ = 0;
  count_ = 0;
}

const Sample& SampleWindow::At(size_t i) const {
  return buf_[(head_ + i) % buf_.size()];
}

ClockFilter::ClockFilter(size_t window, double local_precision)
    : window_(window), local_precision_(local_precision) {}

bool ClockFilter::Add(const Sample& sample, FilteredStat* out) {
  window_.Push(sample);

  const size_t n = window_.size();
  const ntpproto::TimeSpec now = window_.Newest().t4;

  // Minimum delay; iterating oldest to newest with <= lets newer win ties.
  size_t sel = 0;
  for (size_t i = 1; i < n; ++i) {
    if (window_.At(i).delay <= window_.At(sel).delay) sel = i;
  }
  const Sample& best = window_.At(sel);

  double jitter = 0.0;
  if (n > 1) {
    double sum_sq = 0.0;
    for (size_t i = 0; i < n; ++i) {
      if (i == sel) continue;
      double d = window_.At(i).offset - best.offset;
      sum_sq += d * d;
    }
    jitter = std::sqrt(sum_sq / static_cast<double>(n - 1));
  }
  jitter = std::max(jitter, local_precision_);

  std::vector<size_t> order(n);
  std::iota(order.begin(), order.end(), size_t{0});
  std::stable_sort(order.begin(), order.end(), [this](size_t a, size_t b) {
    return window_.At(a).delay < window_.At(b).delay;
  });

  double eps = 0.0;
  double weight = 0.5;
  for (size_t i = 0; i < window_.capacity(); ++i, weight *= 0.5) {
    double slot = kMaxDispersion;
    if (i < n) {
      const Sample& s = window_.At(order[i]);
      double age = std::max(0.0, ntpproto::DiffSeconds(now, s.t4));
      slot = std::min(kMaxDispersion, s.dispersion + kPhi * age);
    }
    eps += slot * weight;
  }

  FilteredStat stat;
  stat.offset = best.offset;
  stat.delay = best.delay;
  stat.jitter = jitter;
  stat.root_delay = best.root_delay + best.delay;
  stat.root_dispersion = best.root_dispersion + eps;
  stat.dispersion = stat.root_delay / 2.0 + stat.root_dispersion;
  stat.stratum = window_.Newest().stratum;
  stat.leap = window_.Newest().leap;
  stat.time = best.t4;
  stat.update_time = now;
  if (out) *out = stat;

  bool fresh = !has_selected_ || last_selected_ < best.t4;
  if (fresh) {
    last_selected_ = best.t4;
    has_selected_ = true;
  }
  return fresh;
}

void ClockFilter::Clear() {
  window_.Clear();
  has_selected_ = false;
  last_selected_ = ntpproto::TimeSpec();
}

}  // namespace ntpsync
