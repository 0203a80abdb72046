// Copyright (c) 2025
/**
 * @file monotonic_clock.cc
 * @brief POSIX-specific implementation using clock_gettime().
 */
#include "ntpproto/monotonic_clock.hpp"

#include <time.h>

#include <chrono>
#include <cmath>
#include <mutex>

namespace ntpproto {

namespace {
// Frequency corrections beyond this are refused.
constexpr double kMaxSlewPpm = 100000.0;
}  // namespace

struct MonotonicClock::Impl {
  mutable std::mutex mtx_;
  int64_t mono_t0_nsec_{0};  // Monotonic anchor (nanoseconds)
  TimeSpec start_time_{};    // Disciplined time at anchor
  double ppm_{0.0};          // Frequency correction

  static TimeSpec CurrentUnix() {
    auto now = std::chrono::system_clock::now();
    auto duration = now.time_since_epoch();
    auto sec = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nsec =
        std::chrono::duration_cast<std::chrono::nanoseconds>(duration - sec);
    return TimeSpec(sec.count(), static_cast<uint32_t>(nsec.count()));
  }

  static int64_t MonotonicNow() {
    timespec ts{};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1'000'000'000LL +
           static_cast<int64_t>(ts.tv_nsec);
  }

  // Caller holds mtx_.
  TimeSpec NowAt(int64_t mono_now) const {
    double elapsed = static_cast<double>(mono_now - mono_t0_nsec_) / 1e9;
    return AddSeconds(start_time_, elapsed * (1.0 + ppm_ * 1e-6));
  }

  // Caller holds mtx_.
  void Reanchor(int64_t mono_now, const TimeSpec& at) {
    mono_t0_nsec_ = mono_now;
    start_time_ = at;
  }
};

MonotonicClock::MonotonicClock() : impl_(std::make_unique<Impl>()) {
  ResetToRealTime();
}

MonotonicClock::~MonotonicClock() = default;

TimeSpec MonotonicClock::NowUnix() {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  return impl_->NowAt(Impl::MonotonicNow());
}

bool MonotonicClock::StepTime(double offset_s) {
  if (!std::isfinite(offset_s)) return false;
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  int64_t mono_now = Impl::MonotonicNow();
  impl_->Reanchor(mono_now, AddSeconds(impl_->NowAt(mono_now), offset_s));
  return true;
}

bool MonotonicClock::SlewFrequency(double ppm) {
  if (!std::isfinite(ppm) || std::fabs(ppm) > kMaxSlewPpm) return false;
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  // Re-anchor first so the new rate applies only from now on.
  int64_t mono_now = Impl::MonotonicNow();
  impl_->Reanchor(mono_now, impl_->NowAt(mono_now));
  impl_->ppm_ = ppm;
  return true;
}

double MonotonicClock::GetFrequencyPpm() const {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  return impl_->ppm_;
}

void MonotonicClock::ResetToRealTime() {
  std::lock_guard<std::mutex> lk(impl_->mtx_);
  impl_->Reanchor(Impl::MonotonicNow(), Impl::CurrentUnix());
  impl_->ppm_ = 0.0;
}

}  // namespace ntpproto
