// Copyright (c) 2025 <Your Name>
/**
 * @file peer.hpp
 * @brief Per-source request/response protocol state machine.
 *
 * A Peer builds client requests, remembers the one outstanding origin
 * timestamp, and validates responses against it. A valid response yields a
 * Sample; every other outcome is reported through RejectReason.
 */
#pragma once

#include <cstdint>
#include <vector>

#include "ntpproto/ntp_packet.hpp"
#include "ntpproto/time_spec.hpp"
#include "ntpsync/types.hpp"

namespace ntpsync {

/** @brief Why a response (or a poll) produced no Sample. */
enum class RejectReason {
  None,
  MalformedPacket,        ///< Short datagram, wrong mode or version
  AuthenticationFailure,  ///< Authentication gate failed
  StaleOrDuplicate,       ///< Origin does not match the outstanding request
  KissOfDeath,            ///< Stratum 0 with DENY, RSTR or RATE
  Unsynchronized,         ///< Leap alarm or stratum 0 / >= 16
  NonFinite,              ///< Derived delay or offset not finite
  BadDelay,               ///< Negative delay or above the sanity ceiling
  Timeout,                ///< Deadline passed without a valid response
};

/** @brief Name of a reject reason for logs. */
const char* ToString(RejectReason reason);

/**
 * @brief Whether a rejection ends the outstanding poll as missed.
 *
 * Malformed and stale datagrams are dropped without touching the poll; a
 * genuine response may still arrive before the deadline.
 */
bool ConcludesPoll(RejectReason reason);

/** @brief Static per-peer configuration. */
struct PeerConfig {
  double max_delay_s = 1.0;       ///< Sanity ceiling on round-trip delay
  double local_precision_s = 0.0;  ///< Local clock precision
  int8_t poll_exponent_hint = 6;  ///< Advertised in the request poll field
};

/** @brief Per-source protocol state machine. */
class Peer {
 public:
  enum class State { Init, AwaitingResponse, Valid, Rejected, TimedOut };
  enum class Event { Poll, Accept, Reject, Deadline, Reset };

  /**
   * @brief Explicit transition function.
   *
   * Poll always leads to AwaitingResponse and Reset always to Init. Accept,
   * Reject and Deadline only act on AwaitingResponse; in any other state
   * they leave the state unchanged.
   */
  static State Transition(State state, Event event);

  explicit Peer(const PeerConfig& config);

  /**
   * @brief Build a client request stamped with t1 = now.
   *
   * @param now Local transmit time, echoed back as the response origin.
   * @param deadline Instant after which the request is considered lost.
   * @param missed_previous Set true if an earlier request was still
   *        outstanding and is now abandoned (counts as a missed poll).
   * @return 48-byte request datagram.
   */
  std::vector<uint8_t> Poll(const ntpproto::TimeSpec& now,
                            const ntpproto::TimeSpec& deadline,
                            bool* missed_previous);

  /**
   * @brief Validate a response and derive a Sample.
   *
   * @param bytes Received datagram.
   * @param t4 Local receive timestamp.
   * @param auth_ok Result of the authentication gate.
   * @param out Sample on success.
   * @param reason Outcome; RejectReason::None on success.
   * @return true if a Sample was produced.
   * @test
   * @brief A second copy of an accepted response is stale.
   * @steps Poll, deliver a matching response twice.
   * @expected First returns true, second returns false with
   *           StaleOrDuplicate.
   */
  bool HandleResponse(const std::vector<uint8_t>& bytes,
                      const ntpproto::TimeSpec& t4, bool auth_ok, Sample* out,
                      RejectReason* reason);

  /**
   * @brief Expire the outstanding request once its deadline has passed.
   * @return true if a request timed out (a missed poll).
   */
  bool CheckTimeout(const ntpproto::TimeSpec& now);

  /** Forget the outstanding request and return to Init. */
  void Reset();

  State state() const { return state_; }
  bool awaiting() const { return state_ == State::AwaitingResponse; }
  const ntpproto::TimeSpec& deadline() const { return deadline_; }

  /** Set once the source sent DENY or RSTR. */
  bool demobilize_requested() const { return demobilize_; }

  /** Returns and clears the pending RATE kiss flag. */
  bool TakeRateKiss();

  void set_poll_exponent_hint(int8_t exponent) {
    config_.poll_exponent_hint = exponent;
  }

 private:
  void Conclude(Event event);

  PeerConfig config_;
  State state_ = State::Init;
  ntpproto::TimeSpec t1_;
  uint64_t origin_ts_ = 0;  ///< Raw transmit timestamp of outstanding request
  ntpproto::TimeSpec deadline_;
  bool demobilize_ = false;
  bool rate_kiss_ = false;
};

}  // namespace ntpsync
