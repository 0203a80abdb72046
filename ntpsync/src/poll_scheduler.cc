// Copyright (c) 2025 The NTP Sample Authors
#include "ntpsync/poll_scheduler.hpp"

#include <algorithm>
#include <cmath>

namespace ntpsync {

PollScheduler::PollScheduler(int minpoll, int maxpoll)
    : minpoll_(minpoll), maxpoll_(std::max(minpoll, maxpoll)) {}

PollState PollScheduler::Initial() const {
  PollState st;
  st.exponent = static_cast<int8_t>(minpoll_);
  return st;
}

double PollScheduler::IntervalSeconds(const PollState& state) const {
  return std::ldexp(1.0, std::clamp<int>(state.exponent, minpoll_, maxpoll_));
}

void PollScheduler::OnSuccess(PollState* state) const {
  state->reach = static_cast<uint8_t>((state->reach << 1) | 1U);
  ++state->streak;
}

void PollScheduler::OnMiss(PollState* state) const {
  state->reach = static_cast<uint8_t>(state->reach << 1);
  Bump(state, -1);
}

void PollScheduler::OnRound(PollState* state, bool survived,
                            bool low_jitter) const {
  if (!low_jitter) {
    Bump(state, -1);
    return;
  }
  if (survived && state->streak >= kIncreaseStreak) Bump(state, +1);
}

void PollScheduler::OnRateKiss(PollState* state) const { Bump(state, +1); }

void PollScheduler::Bump(PollState* state, int delta) const {
  state->exponent =
      static_cast<int8_t>(std::clamp(state->exponent + delta, minpoll_, maxpoll_));
  state->streak = 0;
}

bool IsLowJitterRound(double offset, double jitter) {
  return std::fabs(offset) < kPollGate * jitter;
}

}  // namespace ntpsync
