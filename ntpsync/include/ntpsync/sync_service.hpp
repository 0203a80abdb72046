// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Multi-source synchronization service.
 *
 * SyncService runs one worker thread per source and one round thread. The
 * workers exchange packets and feed their sessions; the round thread runs
 * selection, combining and the discipline, and is the only thread that
 * steps or slews the clock.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "ntpproto/time_source.hpp"
#include "ntpproto/time_spec.hpp"
#include "ntpsync/discipline.hpp"
#include "ntpsync/options.hpp"
#include "ntpsync/peer.hpp"
#include "ntpsync/types.hpp"

namespace ntpsync {

/**
 * @brief Per-source status line.
 */
struct SourceStatus {
  SourceId id = 0;
  Endpoint endpoint;
  bool has_stat = false;
  double offset_s = 0.0;
  double delay_s = 0.0;
  double dispersion_s = 0.0;
  double jitter_s = 0.0;
  int stratum = 0;
  int poll_exponent = 0;
  uint8_t reach = 0;
  RejectReason last_reject = RejectReason::None;
  uint64_t polls = 0;
  uint64_t valid = 0;
  uint64_t missed = 0;
  bool survivor = false;
  bool falseticker = false;
};

/**
 * @brief Current synchronization status snapshot.
 */
struct Status {
  bool synchronized = false;
  double offset_s = 0.0;
  double jitter_s = 0.0;
  int stratum = kMaxStratum;
  ntpproto::LeapIndicator leap = ntpproto::LeapIndicator::Unsynchronized;
  DisciplineState::Mode mode = DisciplineState::Mode::Unset;
  double frequency_ppm = 0.0;
  bool alarm = false;
  Adjustment::Correction last_correction = Adjustment::Correction::None;
  double last_correction_amount_s = 0.0;
  uint64_t rounds = 0;
  int truechimers = 0;
  int survivors = 0;
  SourceId system_peer = 0;
  int workers = 0;  ///< Source workers still holding a socket
  std::string last_error;
  std::vector<SourceStatus> sources;

  /** Stream formatter for logging. */
  friend std::ostream& operator<<(std::ostream& os, const Status& s);
};

/**
 * @brief NTP-style multi-source synchronized clock service.
 *
 * Control background synchronization with Start/Stop. NowUnix() returns the
 * disciplined time as a TimeSpec.
 */
class SyncService {
 public:
  SyncService();
  ~SyncService();

  SyncService(const SyncService&) = delete;
  SyncService& operator=(const SyncService&) = delete;

  /**
   * @brief Start background synchronization.
   * @param clock Clock to discipline (must remain valid until Stop).
   * @param opt Immutable options snapshot; its sources are added.
   * @return false if clock is null or a source socket failed to open.
   */
  bool Start(ntpproto::TimeSource* clock, const Options& opt);

  /** Start with the platform default clock, owned by the service. */
  bool Start(const Options& opt);

  /** Stop every worker and the round thread. */
  void Stop();

  /**
   * @brief Add a source while running.
   * @param ip IPv4 address in numeric form (no DNS).
   * @param port UDP port of the source.
   * @param out_id Receives the stable id on success.
   * @return false if not running or the socket failed to open.
   */
  bool AddSource(const std::string& ip, uint16_t port, SourceId* out_id = nullptr);

  /** Remove a source and stop its worker; false if the id is unknown. */
  bool RemoveSource(SourceId id);

  /** Operator acknowledgement of a discipline alarm. */
  void ClearAlarm();

  /** Return the disciplined current time. */
  ntpproto::TimeSpec NowUnix() const;

  Status GetStatus() const;
  Options GetOptions() const;
  bool IsRunning() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> p_;
};

}  // namespace ntpsync
