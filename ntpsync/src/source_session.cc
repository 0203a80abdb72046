// Copyright (c) 2025 The NTP Sample Authors
/**
 * @file source_session.cc
 * @brief Per-source session: exchange bookkeeping and snapshot publishing.
 */
#include "ntpsync/source_session.hpp"

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace ntpsync {

SessionConfig SessionConfig::FromOptions(const Options& opt) {
  SessionConfig c;
  c.window = static_cast<size_t>(opt.WindowSize());
  c.local_precision_s = opt.PrecisionSeconds();
  c.max_delay_s = opt.MaxDelayMs() / 1000.0;
  c.response_timeout_s = opt.ResponseTimeoutMs() / 1000.0;
  c.minpoll = opt.MinPoll();
  c.maxpoll = opt.MaxPoll();
  return c;
}

namespace {

PeerConfig MakePeerConfig(const SessionConfig& c) {
  PeerConfig pc;
  pc.max_delay_s = c.max_delay_s;
  pc.local_precision_s = c.local_precision_s;
  pc.poll_exponent_hint = static_cast<int8_t>(c.minpoll);
  return pc;
}

}  // namespace

SourceSession::SourceSession(
    SourceId id, const Endpoint& endpoint, const SessionConfig& config,
    std::shared_ptr<const std::atomic<uint64_t>> reset_epoch, LogCallback log)
    : id_(id),
      endpoint_(endpoint),
      config_(config),
      reset_epoch_(std::move(reset_epoch)),
      log_(std::move(log)),
      peer_(MakePeerConfig(config)),
      filter_(config.window, config.local_precision_s),
      scheduler_(config.minpoll, config.maxpoll),
      poll_(scheduler_.Initial()) {
  if (reset_epoch_) epoch_ = reset_epoch_->load();
  Publish();
}

std::vector<uint8_t> SourceSession::Poll(const ntpproto::TimeSpec& now) {
  SyncEpoch();
  ApplyRoundFeedback();

  peer_.set_poll_exponent_hint(poll_.exponent);
  bool missed_previous = false;
  std::vector<uint8_t> req = peer_.Poll(
      now, ntpproto::AddSeconds(now, config_.response_timeout_s),
      &missed_previous);
  if (missed_previous) Miss(RejectReason::Timeout);

  poll_.last_poll = now;
  polled_ = true;
  ++counters_.polls;
  Publish();
  return req;
}

RejectReason SourceSession::HandlePacket(const std::vector<uint8_t>& bytes,
                                         const ntpproto::TimeSpec& t4,
                                         bool auth_ok, bool* fresh) {
  if (fresh) *fresh = false;
  SyncEpoch();
  // A response that arrives after its deadline is stale.
  CheckTimeout(t4);

  Sample sample;
  RejectReason reason = RejectReason::None;
  if (!peer_.HandleResponse(bytes, t4, auth_ok, &sample, &reason)) {
    last_reject_ = reason;
    if (ConcludesPoll(reason)) {
      Miss(reason);
      if (peer_.TakeRateKiss()) {
        scheduler_.OnRateKiss(&poll_);
        Log(LogLevel::Warning, "RATE kiss received, backing off");
      }
      if (peer_.demobilize_requested()) {
        Log(LogLevel::Warning, "DENY/RSTR kiss received, demobilizing");
      }
    } else {
      ++counters_.dropped;
      Log(LogLevel::Debug,
          std::string("dropped datagram: ") + ToString(reason));
    }
    Publish();
    return reason;
  }

  const bool is_fresh = filter_.Add(sample, &stat_);
  has_stat_ = true;
  last_reject_ = RejectReason::None;
  scheduler_.OnSuccess(&poll_);
  ++counters_.valid;
  if (is_fresh) awaiting_feedback_ = true;
  if (fresh) *fresh = is_fresh;

  std::ostringstream oss;
  oss << "sample offset=" << sample.offset << "s delay=" << sample.delay
      << "s filtered offset=" << stat_.offset << "s disp=" << stat_.dispersion
      << "s jitter=" << stat_.jitter << "s";
  Log(LogLevel::Debug, oss.str());

  Publish();
  return RejectReason::None;
}

bool SourceSession::CheckTimeout(const ntpproto::TimeSpec& now) {
  SyncEpoch();
  if (!peer_.CheckTimeout(now)) return false;
  last_reject_ = RejectReason::Timeout;
  Miss(RejectReason::Timeout);
  Publish();
  return true;
}

void SourceSession::ApplyRoundFeedback() {
  if (!awaiting_feedback_) return;
  std::shared_ptr<const RoundFeedback> fb =
      std::atomic_exchange(&feedback_, std::shared_ptr<const RoundFeedback>());
  if (!fb) return;
  scheduler_.OnRound(&poll_, fb->survived, fb->low_jitter);
  awaiting_feedback_ = false;
  Publish();
}

void SourceSession::PostRoundFeedback(
    std::shared_ptr<const RoundFeedback> feedback) {
  std::atomic_store(&feedback_, std::move(feedback));
}

ntpproto::TimeSpec SourceSession::NextPollTime() const {
  if (!polled_) return ntpproto::TimeSpec();
  return ntpproto::AddSeconds(poll_.last_poll,
                              scheduler_.IntervalSeconds(poll_));
}

std::shared_ptr<const SourceSnapshot> SourceSession::Snapshot() const {
  return std::atomic_load(&snapshot_);
}

void SourceSession::SyncEpoch() {
  if (!reset_epoch_) return;
  const uint64_t current = reset_epoch_->load();
  if (current == epoch_) return;
  // The clock was stepped; samples taken before it are meaningless.
  epoch_ = current;
  filter_.Clear();
  peer_.Reset();
  has_stat_ = false;
  polled_ = false;
  awaiting_feedback_ = false;
  std::atomic_store(&feedback_, std::shared_ptr<const RoundFeedback>());
  Log(LogLevel::Info, "clock reset, samples discarded");
  Publish();
}

void SourceSession::Miss(RejectReason reason) {
  scheduler_.OnMiss(&poll_);
  ++counters_.missed;
  const LogLevel level = reason == RejectReason::AuthenticationFailure ||
                                 reason == RejectReason::KissOfDeath
                             ? LogLevel::Warning
                             : LogLevel::Debug;
  Log(level, std::string("missed poll: ") + ToString(reason));
}

void SourceSession::Publish() {
  auto snap = std::make_shared<SourceSnapshot>();
  snap->id = id_;
  snap->endpoint = endpoint_;
  snap->epoch = epoch_;
  snap->has_stat = has_stat_;
  snap->stat = stat_;
  snap->poll = poll_;
  snap->peer_state = peer_.state();
  snap->last_reject = last_reject_;
  snap->counters = counters_;
  snap->demobilize = peer_.demobilize_requested();
  std::atomic_store(&snapshot_,
                    std::shared_ptr<const SourceSnapshot>(std::move(snap)));
}

void SourceSession::Log(LogLevel level, const std::string& text) const {
  if (log_) log_(level, "[Source " + std::to_string(id_) + "] " + text);
}

}  // namespace ntpsync
