// Copyright (c) 2025 The NTP Sample Authors
/**
 * @file peer.cc
 * @brief Request construction and response validation.
 */
#include "ntpsync/peer.hpp"

#include <vector>

namespace ntpsync {

const char* ToString(RejectReason reason) {
  switch (reason) {
    case RejectReason::None:
      return "none";
    case RejectReason::MalformedPacket:
      return "malformed";
    case RejectReason::AuthenticationFailure:
      return "auth-failure";
    case RejectReason::StaleOrDuplicate:
      return "stale";
    case RejectReason::KissOfDeath:
      return "kiss-o-death";
    case RejectReason::Unsynchronized:
      return "unsynchronized";
    case RejectReason::NonFinite:
      return "non-finite";
    case RejectReason::BadDelay:
      return "bad-delay";
    case RejectReason::Timeout:
      return "timeout";
  }
  return "?";
}

bool ConcludesPoll(RejectReason reason) {
  switch (reason) {
    case RejectReason::None:
    case RejectReason::MalformedPacket:
    case RejectReason::StaleOrDuplicate:
      return false;
    default:
      return true;
  }
}

Peer::State Peer::Transition(State state, Event event) {
  switch (event) {
    case Event::Poll:
      return State::AwaitingResponse;
    case Event::Reset:
      return State::Init;
    case Event::Accept:
      return state == State::AwaitingResponse ? State::Valid : state;
    case Event::Reject:
      return state == State::AwaitingResponse ? State::Rejected : state;
    case Event::Deadline:
      return state == State::AwaitingResponse ? State::TimedOut : state;
  }
  return state;
}

Peer::Peer(const PeerConfig& config) : config_(config) {}

std::vector<uint8_t> Peer::Poll(const ntpproto::TimeSpec& now,
                                const ntpproto::TimeSpec& deadline,
                                bool* missed_previous) {
  if (missed_previous) *missed_previous = awaiting();

  ntpproto::NtpHeader req;
  req.leap = ntpproto::LeapIndicator::NoWarning;
  req.version = ntpproto::kNtpVersion;
  req.mode = ntpproto::Mode::Client;
  req.poll = config_.poll_exponent_hint;
  req.transmit_ts = now.ToNtpTimestamp();

  t1_ = now;
  origin_ts_ = req.transmit_ts;
  deadline_ = deadline;
  state_ = Transition(state_, Event::Poll);
  return ntpproto::SerializeHeader(req);
}

bool Peer::HandleResponse(const std::vector<uint8_t>& bytes,
                          const ntpproto::TimeSpec& t4, bool auth_ok,
                          Sample* out, RejectReason* reason) {
  RejectReason dummy = RejectReason::None;
  RejectReason& why = reason ? *reason : dummy;
  why = RejectReason::None;

  ntpproto::NtpHeader resp;
  if (!ntpproto::ParseHeader(bytes, &resp)) {
    why = RejectReason::MalformedPacket;
    return false;
  }
  if (resp.mode != ntpproto::Mode::Server || resp.version < 1 ||
      resp.version > ntpproto::kNtpVersion) {
    why = RejectReason::MalformedPacket;
    return false;
  }

  // Only the response to the outstanding request is accepted; this also
  // covers duplicates, replays and responses that arrive without a poll.
  if (!awaiting() || resp.origin_ts != origin_ts_) {
    why = RejectReason::StaleOrDuplicate;
    return false;
  }

  if (!auth_ok) {
    why = RejectReason::AuthenticationFailure;
    Conclude(Event::Reject);
    return false;
  }

  if (resp.stratum == 0) {
    if (resp.ref_id == ntpproto::kiss::kDeny ||
        resp.ref_id == ntpproto::kiss::kRstr) {
      demobilize_ = true;
      why = RejectReason::KissOfDeath;
      Conclude(Event::Reject);
      return false;
    }
    if (resp.ref_id == ntpproto::kiss::kRate) {
      rate_kiss_ = true;
      why = RejectReason::KissOfDeath;
      Conclude(Event::Reject);
      return false;
    }
  }

  if (resp.leap == ntpproto::LeapIndicator::Unsynchronized ||
      resp.stratum == 0 || resp.stratum >= kMaxStratum) {
    why = RejectReason::Unsynchronized;
    Conclude(Event::Reject);
    return false;
  }

  Sample sample;
  if (!MakeSample(t1_, ntpproto::TimeSpec::FromNtpTimestamp(resp.receive_ts),
                  ntpproto::TimeSpec::FromNtpTimestamp(resp.transmit_ts), t4,
                  resp, config_.local_precision_s, &sample)) {
    why = RejectReason::NonFinite;
    Conclude(Event::Reject);
    return false;
  }
  if (sample.delay < 0.0 || sample.delay > config_.max_delay_s) {
    why = RejectReason::BadDelay;
    Conclude(Event::Reject);
    return false;
  }

  Conclude(Event::Accept);
  if (out) *out = sample;
  return true;
}

bool Peer::CheckTimeout(const ntpproto::TimeSpec& now) {
  if (!awaiting() || now < deadline_) return false;
  Conclude(Event::Deadline);
  return true;
}

void Peer::Reset() {
  origin_ts_ = 0;
  state_ = Transition(state_, Event::Reset);
}

bool Peer::TakeRateKiss() {
  bool r = rate_kiss_;
  rate_kiss_ = false;
  return r;
}

void Peer::Conclude(Event event) {
  state_ = Transition(state_, event);
  // The origin is single-use.
  origin_ts_ = 0;
}

}  // namespace ntpsync
