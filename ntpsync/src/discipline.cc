// Copyright (c) 2025 The NTP Sample Authors
/**
 * @file discipline.cc
 * @brief Clock discipline state machine and PI update.
 */
#include "ntpsync/discipline.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <utility>

namespace ntpsync {

namespace {
// Re-issue the slew only when the rate moved by more than this.
constexpr double kRateEpsilonPpm = 0.01;
}  // namespace

const char* ToString(DisciplineState::Mode mode) {
  switch (mode) {
    case DisciplineState::Mode::Unset:
      return "unset";
    case DisciplineState::Mode::FrequencyAcquire:
      return "freq-acquire";
    case DisciplineState::Mode::Spike:
      return "spike";
    case DisciplineState::Mode::Steady:
      return "steady";
  }
  return "?";
}

const char* ToString(Adjustment::Correction correction) {
  switch (correction) {
    case Adjustment::Correction::None:
      return "none";
    case Adjustment::Correction::Slew:
      return "slew";
    case Adjustment::Correction::Step:
      return "step";
    case Adjustment::Correction::Refused:
      return "refused";
  }
  return "?";
}

Discipline::Discipline(ntpproto::TimeSource* clock,
                       const DisciplineConfig& config, LogCallback log)
    : clock_(clock), config_(config), log_(std::move(log)) {}

Adjustment Discipline::Update(const SystemStat& stat,
                              const ntpproto::TimeSpec& now,
                              int poll_exponent) {
  using Mode = DisciplineState::Mode;
  Adjustment adj;
  adj.frequency_ppm = state_.frequency_ppm;
  if (!stat.synchronized || clock_ == nullptr) return adj;

  const double offset = stat.offset;
  if (state_.alarm || !std::isfinite(offset)) {
    adj.correction = Adjustment::Correction::Refused;
    adj.amount_s = offset;
    return adj;
  }

  if (std::fabs(offset) > config_.panic_threshold_s) {
    ++state_.panic_count;
    std::ostringstream oss;
    oss << "offset " << offset << "s exceeds panic threshold "
        << config_.panic_threshold_s << "s (" << state_.panic_count << "/"
        << config_.panic_limit << ")";
    if (state_.panic_count >= config_.panic_limit) {
      state_.alarm = true;
      oss << "; alarm raised, corrections stopped";
      Log(LogLevel::Error, oss.str());
    } else {
      Log(LogLevel::Warning, oss.str());
    }
    adj.correction = Adjustment::Correction::Refused;
    adj.amount_s = offset;
    return adj;
  }
  state_.panic_count = 0;
  state_.tau_s = TimeConstant(stat, poll_exponent);

  if (std::fabs(offset) >= config_.step_threshold_s) {
    if (!clock_->StepTime(offset)) {
      Log(LogLevel::Error, "clock refused step of " + std::to_string(offset));
      adj.correction = Adjustment::Correction::Refused;
      adj.amount_s = offset;
      return adj;
    }
    // Timestamps taken before the step are now off by `offset`.
    const ntpproto::TimeSpec after = ntpproto::AddSeconds(now, offset);
    state_.phase_s = 0.0;
    state_.last_offset_s = 0.0;
    state_.last_update = after;
    state_.cooldown_until = ntpproto::AddSeconds(after, config_.cooldown_s);
    amortized_s_ = 0.0;
    if (state_.mode == Mode::Unset || state_.mode == Mode::FrequencyAcquire) {
      state_.mode = Mode::FrequencyAcquire;
      state_.acquire_rounds = 0;
    } else {
      state_.mode = Mode::Spike;
    }
    ApplySlew(after);

    std::ostringstream oss;
    oss << "step " << offset << "s, mode=" << ToString(state_.mode);
    Log(LogLevel::Info, oss.str());
    adj.correction = Adjustment::Correction::Step;
    adj.amount_s = offset;
    adj.frequency_ppm = state_.frequency_ppm;
    return adj;
  }

  switch (state_.mode) {
    case Mode::Unset:
      state_.mode = Mode::FrequencyAcquire;
      state_.acquire_rounds = 0;
      break;

    case Mode::FrequencyAcquire: {
      const double mu = ntpproto::DiffSeconds(now, state_.last_update);
      if (mu < config_.acquire_interval_s) {
        // Keep slewing the earlier phase; the measurement span is too short.
        return adj;
      }
      // Drift not explained by the phase removed since the last update.
      const double drift_ppm =
          (offset - (state_.last_offset_s - amortized_s_)) / mu * 1e6;
      state_.frequency_ppm =
          std::clamp(state_.frequency_ppm + drift_ppm,
                     -config_.max_frequency_ppm, config_.max_frequency_ppm);
      ++state_.acquire_rounds;
      if (std::fabs(drift_ppm) < config_.frequency_tolerance_ppm ||
          state_.acquire_rounds >= config_.max_acquire_rounds) {
        state_.mode = Mode::Steady;
        std::ostringstream oss;
        oss << "frequency acquired: " << state_.frequency_ppm << "ppm after "
            << state_.acquire_rounds << " measurement(s)";
        Log(LogLevel::Info, oss.str());
      }
      break;
    }

    case Mode::Spike:
    case Mode::Steady: {
      if (state_.mode == Mode::Spike && now >= state_.cooldown_until) {
        state_.mode = Mode::Steady;
        Log(LogLevel::Info, "spike cooldown elapsed, mode=steady");
      }
      if (state_.mode == Mode::Steady) {
        const double mu =
            std::max(0.0, ntpproto::DiffSeconds(now, state_.last_update));
        const double tau = state_.tau_s;
        state_.frequency_ppm = std::clamp(
            state_.frequency_ppm + offset * mu / (4.0 * tau * tau) * 1e6,
            -config_.max_frequency_ppm, config_.max_frequency_ppm);
      }
      break;
    }
  }

  state_.phase_s = offset;
  state_.last_offset_s = offset;
  state_.last_update = now;
  amortized_s_ = 0.0;
  ApplySlew(now);

  adj.correction = Adjustment::Correction::Slew;
  adj.amount_s = offset;
  adj.frequency_ppm = state_.frequency_ppm;
  return adj;
}

void Discipline::Tick(const ntpproto::TimeSpec& now) {
  if (state_.mode == DisciplineState::Mode::Unset || state_.alarm ||
      clock_ == nullptr) {
    last_tick_ = now;
    return;
  }
  const double dt = ntpproto::DiffSeconds(now, last_tick_);
  if (dt <= 0.0) return;

  // Phase removed while the clock ran at the applied rate.
  double removed = (applied_rate_ppm_ - state_.frequency_ppm) * 1e-6 * dt;
  if (state_.phase_s >= 0.0) {
    removed = std::clamp(removed, 0.0, state_.phase_s);
  } else {
    removed = std::clamp(removed, state_.phase_s, 0.0);
  }
  state_.phase_s -= removed;
  amortized_s_ += removed;
  last_tick_ = now;

  if (std::fabs(SlewRatePpm() - applied_rate_ppm_) > kRateEpsilonPpm) {
    ApplySlew(now);
  }
}

void Discipline::ClearAlarm() {
  if (state_.alarm) Log(LogLevel::Info, "alarm cleared");
  state_.alarm = false;
  state_.panic_count = 0;
  state_.mode = DisciplineState::Mode::Unset;
  state_.phase_s = 0.0;
  amortized_s_ = 0.0;
}

double Discipline::TimeConstant(const SystemStat& stat,
                                int poll_exponent) const {
  const double jitter =
      std::sqrt(stat.jitter * stat.jitter + stat.peer_jitter * stat.peer_jitter);
  const double scale =
      config_.jitter_reference_s > 0.0
          ? std::max(1.0, jitter / config_.jitter_reference_s)
          : 1.0;
  const double tau = std::ldexp(1.0, poll_exponent) * kLoopScale * scale;
  return std::min(config_.max_tau_s, std::max(config_.min_tau_s, tau));
}

double Discipline::SlewRatePpm() const {
  double rate = state_.frequency_ppm;
  if (state_.tau_s > 0.0) rate += state_.phase_s / state_.tau_s * 1e6;
  return std::clamp(rate, -config_.max_slew_ppm, config_.max_slew_ppm);
}

void Discipline::ApplySlew(const ntpproto::TimeSpec& now) {
  const double rate = SlewRatePpm();
  if (clock_->SlewFrequency(rate)) {
    applied_rate_ppm_ = rate;
  } else {
    Log(LogLevel::Warning,
        "clock refused frequency " + std::to_string(rate) + "ppm");
  }
  last_tick_ = now;
}

void Discipline::Log(LogLevel level, const std::string& text) const {
  if (log_) log_(level, "[Discipline] " + text);
}

}  // namespace ntpsync
