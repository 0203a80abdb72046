// Copyright (c) 2025 <Your Name>
/**
 * @file source_session.hpp
 * @brief One source's protocol, filter and poll state, plus its snapshot.
 *
 * A session has exactly one writer (the source's worker). Everything the
 * synchronization round needs is published as an immutable SourceSnapshot
 * through an atomic shared_ptr swap, so readers never see a torn stat and
 * never take the writer's lock.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ntpproto/time_spec.hpp"
#include "ntpsync/clock_filter.hpp"
#include "ntpsync/log.hpp"
#include "ntpsync/options.hpp"
#include "ntpsync/peer.hpp"
#include "ntpsync/poll_scheduler.hpp"
#include "ntpsync/types.hpp"

namespace ntpsync {

/** @brief Per-source counters. */
struct SourceCounters {
  uint64_t polls = 0;
  uint64_t valid = 0;     ///< Samples accepted
  uint64_t missed = 0;    ///< Timeouts, rejections, abandoned polls
  uint64_t dropped = 0;   ///< Malformed or stale datagrams
};

/** @brief Immutable view of a session published after every change. */
struct SourceSnapshot {
  SourceId id = 0;
  Endpoint endpoint;
  uint64_t epoch = 0;  ///< Reset epoch the stat belongs to
  bool has_stat = false;
  FilteredStat stat;
  PollState poll;
  Peer::State peer_state = Peer::State::Init;
  RejectReason last_reject = RejectReason::None;
  SourceCounters counters;
  bool demobilize = false;  ///< Source asked to stop (DENY/RSTR)
};

/** @brief Round outcome delivered back to a participating session. */
struct RoundFeedback {
  uint64_t round = 0;
  bool survived = false;
  bool low_jitter = false;
};

/** @brief Session tuning derived from Options. */
struct SessionConfig {
  size_t window = 8;
  double local_precision_s = 1e-6;
  double max_delay_s = 1.0;
  double response_timeout_s = 1.0;
  int minpoll = 4;
  int maxpoll = 10;

  static SessionConfig FromOptions(const Options& opt);
};

/**
 * @brief Bundles Peer, ClockFilter and PollState for one source.
 *
 * All mutating calls must come from a single thread. Snapshot(),
 * PostRoundFeedback() and MarkRemoved() may be called from any thread.
 */
class SourceSession {
 public:
  /**
   * @param id Stable id assigned by the engine.
   * @param endpoint Source address.
   * @param config Tuning.
   * @param reset_epoch Shared epoch counter; a change discards samples.
   * @param log Optional sink.
   */
  SourceSession(SourceId id, const Endpoint& endpoint,
                const SessionConfig& config,
                std::shared_ptr<const std::atomic<uint64_t>> reset_epoch,
                LogCallback log = LogCallback());

  SourceSession(const SourceSession&) = delete;
  SourceSession& operator=(const SourceSession&) = delete;

  /**
   * @brief Start a new exchange.
   *
   * Applies pending round feedback first. An exchange still outstanding is
   * abandoned and counted as missed.
   *
   * @return Request datagram to send.
   */
  std::vector<uint8_t> Poll(const ntpproto::TimeSpec& now);

  /**
   * @brief Process one received datagram.
   *
   * @param bytes Datagram after the authentication gate ran.
   * @param t4 Local receive timestamp.
   * @param auth_ok Authentication gate verdict.
   * @param fresh Set true when the filter produced a new estimate.
   * @return RejectReason::None if a sample was accepted.
   */
  RejectReason HandlePacket(const std::vector<uint8_t>& bytes,
                            const ntpproto::TimeSpec& t4, bool auth_ok,
                            bool* fresh);

  /**
   * @brief Expire the outstanding exchange if its deadline passed.
   * @return true if the poll was counted as missed.
   */
  bool CheckTimeout(const ntpproto::TimeSpec& now);

  /** Consume the latest round feedback if a fresh sample awaits it. */
  void ApplyRoundFeedback();

  /** Called by the round to deliver feedback (any thread). */
  void PostRoundFeedback(std::shared_ptr<const RoundFeedback> feedback);

  /** Next instant a poll is due; a zero TimeSpec means "now". */
  ntpproto::TimeSpec NextPollTime() const;

  bool Awaiting() const { return peer_.awaiting(); }
  ntpproto::TimeSpec Deadline() const { return peer_.deadline(); }

  /** Latest published snapshot (any thread). */
  std::shared_ptr<const SourceSnapshot> Snapshot() const;

  /** Flag the session as removed; its worker stops at the next step. */
  void MarkRemoved() { removed_.store(true); }
  bool removed() const { return removed_.load(); }

  SourceId id() const { return id_; }
  const Endpoint& endpoint() const { return endpoint_; }

 private:
  void SyncEpoch();
  void Miss(RejectReason reason);
  void Publish();
  void Log(LogLevel level, const std::string& text) const;

  const SourceId id_;
  const Endpoint endpoint_;
  const SessionConfig config_;
  std::shared_ptr<const std::atomic<uint64_t>> reset_epoch_;
  LogCallback log_;

  Peer peer_;
  ClockFilter filter_;
  PollScheduler scheduler_;
  PollState poll_;
  FilteredStat stat_;
  bool has_stat_ = false;
  bool polled_ = false;
  bool awaiting_feedback_ = false;
  uint64_t epoch_ = 0;
  RejectReason last_reject_ = RejectReason::None;
  SourceCounters counters_;

  std::shared_ptr<const SourceSnapshot> snapshot_;
  std::shared_ptr<const RoundFeedback> feedback_;
  std::atomic<bool> removed_{false};
};

}  // namespace ntpsync
