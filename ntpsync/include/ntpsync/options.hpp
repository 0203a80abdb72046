// Copyright (c) 2025 <Your Name>
/**
 * @file options.hpp
 * @brief Immutable engine configuration built with Options::Builder.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "ntpproto/platform/socket_interface.hpp"
#include "ntpsync/log.hpp"

namespace ntpsync {

/** @brief Numeric IPv4 source endpoint. */
using Endpoint = ntpproto::platform::Endpoint;

/**
 * @brief Immutable options for SyncEngine and SyncService.
 *
 * Use the Builder to construct instances. Out-of-range values are clamped
 * by the builder rather than rejected.
 */
class Options {
 public:
  /** @brief Authentication gate; returns true if the datagram passes. */
  using AuthCallback = std::function<bool(const std::vector<uint8_t>&)>;

  static constexpr int kDefaultMinPoll = 4;
  static constexpr int kDefaultMaxPoll = 10;
  static constexpr int kMaxPollLimit = 17;
  static constexpr int kDefaultWindowSize = 8;
  static constexpr int kMaxWindowSize = 64;
  static constexpr double kDefaultStepThresholdMs = 128.0;
  static constexpr double kDefaultPanicThresholdS = 1000.0;
  static constexpr int kDefaultPanicLimit = 3;
  static constexpr double kDefaultCooldownS = 900.0;
  static constexpr double kDefaultMaxDelayMs = 1000.0;
  static constexpr double kDefaultMaxDistanceMs = 1500.0;
  static constexpr int kDefaultResponseTimeoutMs = 1000;
  static constexpr int kDefaultRoundIntervalMs = 1000;
  static constexpr int kDefaultTickMs = 250;
  static constexpr int kDefaultQuorum = 3;
  static constexpr int kDefaultPrecisionLog2 = -20;
  static constexpr double kDefaultMaxFrequencyPpm = 500.0;
  static constexpr double kDefaultAcquireIntervalS = 16.0;
  static constexpr double kDefaultJitterReferenceMs = 1.0;

  class Builder;

  Options() = default;

  /** @name Getters (immutable) */
  ///@{
  const std::vector<Endpoint>& Sources() const { return sources_; }
  int MinPoll() const { return min_poll_; }
  int MaxPoll() const { return max_poll_; }
  int WindowSize() const { return window_size_; }
  double StepThresholdMs() const { return step_threshold_ms_; }
  double PanicThresholdS() const { return panic_threshold_s_; }
  int PanicLimit() const { return panic_limit_; }
  double CooldownS() const { return cooldown_s_; }
  double MaxDelayMs() const { return max_delay_ms_; }
  double MaxDistanceMs() const { return max_distance_ms_; }
  int ResponseTimeoutMs() const { return response_timeout_ms_; }
  int RoundIntervalMs() const { return round_interval_ms_; }
  int TickMs() const { return tick_ms_; }
  int Quorum() const { return quorum_; }
  int PrecisionLog2() const { return precision_log2_; }
  double MaxFrequencyPpm() const { return max_frequency_ppm_; }
  double AcquireIntervalS() const { return acquire_interval_s_; }
  double JitterReferenceMs() const { return jitter_reference_ms_; }
  const LogCallback& LogSink() const { return log_sink_; }
  const AuthCallback& AuthGate() const { return auth_gate_; }
  ///@}

  /** Local precision in seconds (2^PrecisionLog2). */
  double PrecisionSeconds() const;

  /** Stream formatter for logging. */
  friend std::ostream& operator<<(std::ostream& os, const Options& o);

 private:
  std::vector<Endpoint> sources_;
  int min_poll_ = kDefaultMinPoll;
  int max_poll_ = kDefaultMaxPoll;
  int window_size_ = kDefaultWindowSize;
  double step_threshold_ms_ = kDefaultStepThresholdMs;
  double panic_threshold_s_ = kDefaultPanicThresholdS;
  int panic_limit_ = kDefaultPanicLimit;
  double cooldown_s_ = kDefaultCooldownS;
  double max_delay_ms_ = kDefaultMaxDelayMs;
  double max_distance_ms_ = kDefaultMaxDistanceMs;
  int response_timeout_ms_ = kDefaultResponseTimeoutMs;
  int round_interval_ms_ = kDefaultRoundIntervalMs;
  int tick_ms_ = kDefaultTickMs;
  int quorum_ = kDefaultQuorum;
  int precision_log2_ = kDefaultPrecisionLog2;
  double max_frequency_ppm_ = kDefaultMaxFrequencyPpm;
  double acquire_interval_s_ = kDefaultAcquireIntervalS;
  double jitter_reference_ms_ = kDefaultJitterReferenceMs;
  LogCallback log_sink_;
  AuthCallback auth_gate_;
};

/**
 * @brief Fluent builder for Options.
 */
class Options::Builder {
 public:
  Builder();
  explicit Builder(const Options& base);

  /** Add a source endpoint (numeric IPv4, no DNS). */
  Builder& AddSource(const std::string& ip, uint16_t port);
  /** Replace the source list. */
  Builder& Sources(const std::vector<Endpoint>& v);
  /** Minimum poll exponent, log2 seconds (default: 4, range 0..17). */
  Builder& MinPoll(int v);
  /** Maximum poll exponent, log2 seconds (default: 10, range 0..17). */
  Builder& MaxPoll(int v);
  /** Clock filter window N (default: 8, range 1..64). */
  Builder& WindowSize(int v);
  /** Offsets at or above this step instead of slewing (default: 128). */
  Builder& StepThresholdMs(double v);
  /** Offsets above this are refused (default: 1000 s). */
  Builder& PanicThresholdS(double v);
  /** Consecutive refusals that raise the alarm (default: 3). */
  Builder& PanicLimit(int v);
  /** Integral suppression after a step (default: 900 s). */
  Builder& CooldownS(double v);
  /** Round-trip delay ceiling for a valid sample (default: 1000 ms). */
  Builder& MaxDelayMs(double v);
  /** Sources with a larger distance are unfit (default: 1500 ms). */
  Builder& MaxDistanceMs(double v);
  /** Deadline for an outstanding request (default: 1000 ms). */
  Builder& ResponseTimeoutMs(int v);
  /** Round cadence (default: 1000 ms). */
  Builder& RoundIntervalMs(int v);
  /** Phase amortization tick (default: 250 ms). */
  Builder& TickMs(int v);
  /** Fresh sources that trigger an early round (default: 3). */
  Builder& Quorum(int v);
  /** Local clock precision, log2 seconds (default: -20). */
  Builder& PrecisionLog2(int v);
  /** Frequency correction clamp (default: 500 ppm). */
  Builder& MaxFrequencyPpm(double v);
  /** Frequency acquisition span (default: 16 s). */
  Builder& AcquireIntervalS(double v);
  /** Jitter at which the loop time constant starts to grow (default: 1). */
  Builder& JitterReferenceMs(double v);
  /** Install a log sink. */
  Builder& LogSink(LogCallback cb);
  /** Install an authentication gate (default: accept all). */
  Builder& AuthGate(AuthCallback cb);

  Options Build() const;

 private:
  Options opts_;
};

}  // namespace ntpsync
