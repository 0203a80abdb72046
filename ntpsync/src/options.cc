// Copyright (c) 2025 <Your Name>
#include "ntpsync/options.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace ntpsync {

Options::Builder::Builder() = default;

Options::Builder::Builder(const Options& base) : opts_(base) {}

Options::Builder& Options::Builder::AddSource(const std::string& ip,
                                              uint16_t port) {
  opts_.sources_.emplace_back(ip, port);
  return *this;
}

Options::Builder& Options::Builder::Sources(const std::vector<Endpoint>& v) {
  opts_.sources_ = v;
  return *this;
}

Options::Builder& Options::Builder::MinPoll(int v) {
  opts_.min_poll_ = std::clamp(v, 0, kMaxPollLimit);
  return *this;
}

Options::Builder& Options::Builder::MaxPoll(int v) {
  opts_.max_poll_ = std::clamp(v, 0, kMaxPollLimit);
  return *this;
}

Options::Builder& Options::Builder::WindowSize(int v) {
  opts_.window_size_ = std::clamp(v, 1, kMaxWindowSize);
  return *this;
}

Options::Builder& Options::Builder::StepThresholdMs(double v) {
  opts_.step_threshold_ms_ = std::max(0.0, v);
  return *this;
}

Options::Builder& Options::Builder::PanicThresholdS(double v) {
  opts_.panic_threshold_s_ = std::max(0.001, v);
  return *this;
}

Options::Builder& Options::Builder::PanicLimit(int v) {
  opts_.panic_limit_ = std::max(1, v);
  return *this;
}

Options::Builder& Options::Builder::CooldownS(double v) {
  opts_.cooldown_s_ = std::max(0.0, v);
  return *this;
}

Options::Builder& Options::Builder::MaxDelayMs(double v) {
  opts_.max_delay_ms_ = std::max(0.001, v);
  return *this;
}

Options::Builder& Options::Builder::MaxDistanceMs(double v) {
  opts_.max_distance_ms_ = std::max(0.001, v);
  return *this;
}

Options::Builder& Options::Builder::ResponseTimeoutMs(int v) {
  opts_.response_timeout_ms_ = std::max(1, v);
  return *this;
}

Options::Builder& Options::Builder::RoundIntervalMs(int v) {
  opts_.round_interval_ms_ = std::max(10, v);
  return *this;
}

Options::Builder& Options::Builder::TickMs(int v) {
  opts_.tick_ms_ = std::max(10, v);
  return *this;
}

Options::Builder& Options::Builder::Quorum(int v) {
  opts_.quorum_ = std::max(1, v);
  return *this;
}

Options::Builder& Options::Builder::PrecisionLog2(int v) {
  opts_.precision_log2_ = std::clamp(v, -32, 0);
  return *this;
}

Options::Builder& Options::Builder::MaxFrequencyPpm(double v) {
  opts_.max_frequency_ppm_ = std::max(0.0, v);
  return *this;
}

Options::Builder& Options::Builder::AcquireIntervalS(double v) {
  opts_.acquire_interval_s_ = std::max(0.0, v);
  return *this;
}

Options::Builder& Options::Builder::JitterReferenceMs(double v) {
  opts_.jitter_reference_ms_ = std::max(0.0, v);
  return *this;
}

Options::Builder& Options::Builder::LogSink(LogCallback cb) {
  opts_.log_sink_ = std::move(cb);
  return *this;
}

Options::Builder& Options::Builder::AuthGate(AuthCallback cb) {
  opts_.auth_gate_ = std::move(cb);
  return *this;
}

Options Options::Builder::Build() const {
  Options o = opts_;
  o.max_poll_ = std::max(o.min_poll_, o.max_poll_);
  return o;
}

double Options::PrecisionSeconds() const {
  return std::ldexp(1.0, precision_log2_);
}

std::ostream& operator<<(std::ostream& os, const Options& o) {
  os << "sources=" << o.Sources().size() << ", poll=[" << o.MinPoll() << ","
     << o.MaxPoll() << "], window=" << o.WindowSize()
     << ", step>=" << o.StepThresholdMs() << "ms, panic>"
     << o.PanicThresholdS() << "s x" << o.PanicLimit()
     << ", cooldown=" << o.CooldownS() << "s, max_delay=" << o.MaxDelayMs()
     << "ms, max_dist=" << o.MaxDistanceMs()
     << "ms, timeout=" << o.ResponseTimeoutMs()
     << "ms, round=" << o.RoundIntervalMs() << "ms, quorum=" << o.Quorum();
  return os;
}

}  // namespace ntpsync
