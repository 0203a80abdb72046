// Copyright (c) 2025 <Your Name>
/**
 * @file discipline.hpp
 * @brief Phase/frequency feedback loop steering the local clock.
 *
 * The discipline is the only component that calls TimeSource::StepTime()
 * and TimeSource::SlewFrequency(). It consumes one SystemStat per round and
 * amortizes the residual phase between rounds through Tick().
 */
#pragma once

#include "ntpproto/time_source.hpp"
#include "ntpproto/time_spec.hpp"
#include "ntpsync/log.hpp"
#include "ntpsync/types.hpp"

namespace ntpsync {

/** @brief Loop tuning; defaults follow the NTPv4 reference values. */
struct DisciplineConfig {
  double step_threshold_s = 0.128;  ///< |offset| >= this steps
  double panic_threshold_s = 1000.0;  ///< |offset| > this is refused
  int panic_limit = 3;             ///< Consecutive refusals before alarm
  double cooldown_s = 900.0;       ///< Integral suppression after a step
  double acquire_interval_s = 16.0;  ///< Frequency measurement span
  int max_acquire_rounds = 4;
  double frequency_tolerance_ppm = 1.0;  ///< Acquisition converged below this
  double max_frequency_ppm = 500.0;
  double max_slew_ppm = 1000.0;       ///< Frequency + phase rate clamp
  double jitter_reference_s = 1e-3;   ///< Jitter that starts stretching tau
  double min_tau_s = 1.0;             ///< Loop time constant bounds
  double max_tau_s = 524288.0;        ///< 2^17 * kLoopScale
};

/** @brief Loop-scale multiplier: tau = 2^poll * kLoopScale at low jitter. */
constexpr double kLoopScale = 4.0;

/** @brief Long-lived controller state. */
struct DisciplineState {
  enum class Mode { Unset, FrequencyAcquire, Spike, Steady };

  Mode mode = Mode::Unset;
  double frequency_ppm = 0.0;
  double phase_s = 0.0;       ///< Residual phase still being slewed
  double tau_s = 0.0;         ///< Current loop time constant
  double last_offset_s = 0.0;
  ntpproto::TimeSpec last_update;
  ntpproto::TimeSpec cooldown_until;
  int panic_count = 0;
  int acquire_rounds = 0;
  bool alarm = false;  ///< Corrections refused until ClearAlarm()
};

/** @brief Name of a mode for logs and status output. */
const char* ToString(DisciplineState::Mode mode);

/** @brief What one Update() did to the clock. */
struct Adjustment {
  enum class Correction { None, Slew, Step, Refused };

  Correction correction = Correction::None;
  double amount_s = 0.0;       ///< Step size, or phase being slewed
  double frequency_ppm = 0.0;  ///< Frequency estimate after the update
};

const char* ToString(Adjustment::Correction correction);

/**
 * @brief Clock discipline state machine and PI controller.
 *
 * Modes: Unset -> FrequencyAcquire on the first estimate;
 * FrequencyAcquire -> Steady once the measured drift falls below
 * frequency_tolerance_ppm (or after max_acquire_rounds); Steady -> Spike
 * on a step, Spike -> Steady once the cooldown has passed.
 *
 * Not thread-safe; the owner serializes calls.
 */
class Discipline {
 public:
  /**
   * @param clock Clock to steer; must outlive the discipline.
   * @param config Loop tuning.
   * @param log Optional sink.
   */
  Discipline(ntpproto::TimeSource* clock, const DisciplineConfig& config,
             LogCallback log = LogCallback());

  /**
   * @brief Feed one system estimate.
   *
   * @param stat Round result; ignored unless synchronized.
   * @param now Current time of the disciplined clock.
   * @param poll_exponent Poll exponent of the system peer.
   * @return The correction that was applied (or refused).
   * @test
   * @brief Step boundary is inclusive.
   * @steps Feed |offset| == step threshold, then a value just below it.
   * @expected First steps, second slews.
   */
  Adjustment Update(const SystemStat& stat, const ntpproto::TimeSpec& now,
                    int poll_exponent);

  /**
   * @brief Amortize the residual phase up to `now`.
   *
   * Removes phase / tau * dt from the phase accumulator and re-issues the
   * slew rate when it changed.
   */
  void Tick(const ntpproto::TimeSpec& now);

  /** Operator acknowledgement of a discipline alarm. */
  void ClearAlarm();

  DisciplineState State() const { return state_; }

 private:
  double TimeConstant(const SystemStat& stat, int poll_exponent) const;
  double SlewRatePpm() const;
  void ApplySlew(const ntpproto::TimeSpec& now);
  void Log(LogLevel level, const std::string& text) const;

  ntpproto::TimeSource* clock_;
  DisciplineConfig config_;
  LogCallback log_;
  DisciplineState state_;

  ntpproto::TimeSpec last_tick_;
  double applied_rate_ppm_ = 0.0;
  double amortized_s_ = 0.0;  ///< Phase removed since the last Update()
};

}  // namespace ntpsync
