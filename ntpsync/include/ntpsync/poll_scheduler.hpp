// Copyright (c) 2025 <Your Name>
/**
 * @file poll_scheduler.hpp
 * @brief Adaptive per-source poll interval and reachability.
 */
#pragma once

#include <cstdint>

#include "ntpproto/time_spec.hpp"

namespace ntpsync {

/** @brief Successes required before the interval may grow. */
constexpr int kIncreaseStreak = 4;

/** @brief A round is low-jitter when |offset| < kPollGate * jitter. */
constexpr double kPollGate = 4.0;

/** @brief Per-source polling state. */
struct PollState {
  int8_t exponent = 6;  ///< log2 seconds
  uint8_t reach = 0;    ///< Shift register, 1 = poll answered
  ntpproto::TimeSpec last_poll;
  int streak = 0;       ///< Successes since the last exponent change
};

/**
 * @brief Stateless policy applied to a source's PollState.
 *
 * The exponent always stays within [minpoll, maxpoll].
 */
class PollScheduler {
 public:
  PollScheduler(int minpoll, int maxpoll);

  /** @brief Initial state: exponent at minpoll, nothing reached yet. */
  PollState Initial() const;

  /** @brief Poll interval in seconds (2^exponent). */
  double IntervalSeconds(const PollState& state) const;

  /** @brief A poll produced a valid sample. */
  void OnSuccess(PollState* state) const;

  /**
   * @brief A poll was missed (timeout, rejection or authentication failure).
   *
   * Shifts a 0 into reach and polls more often.
   */
  void OnMiss(PollState* state) const;

  /**
   * @brief Feedback from a synchronization round.
   *
   * A high-jitter round polls more often. A low-jitter round in which the
   * source survived grows the interval once kIncreaseStreak consecutive
   * polls have succeeded.
   */
  void OnRound(PollState* state, bool survived, bool low_jitter) const;

  /** @brief The source sent a RATE kiss; back off. */
  void OnRateKiss(PollState* state) const;

  /** @brief An all-zero reach register means unreachable. */
  static bool IsReachable(const PollState& state) { return state.reach != 0; }

  int minpoll() const { return minpoll_; }
  int maxpoll() const { return maxpoll_; }

 private:
  void Bump(PollState* state, int delta) const;

  int minpoll_;
  int maxpoll_;
};

/**
 * @brief Decide whether a round counts as low-jitter.
 *
 * @param offset System offset of the round.
 * @param jitter Effective jitter (system and peer jitter combined).
 */
bool IsLowJitterRound(double offset, double jitter);

}  // namespace ntpsync
