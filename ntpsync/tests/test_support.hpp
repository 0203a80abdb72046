// Copyright (c) 2025 <Your Name>
/**
 * @file test_support.hpp
 * @brief Fake clock and simulated server shared by the ntpsync tests.
 */
#pragma once

#include <cstdint>
#include <mutex>
#include <vector>

#include "ntpproto/ntp_packet.hpp"
#include "ntpproto/time_source.hpp"
#include "ntpproto/time_spec.hpp"
#include "ntpsync/types.hpp"

namespace ntpsync_test {

/** Manually advanced fake clock recording every correction. */
class FakeTimeSource : public ntpproto::TimeSource {
 public:
  explicit FakeTimeSource(const ntpproto::TimeSpec& start =
                              ntpproto::TimeSpec(1735689600, 0))
      : now_(start) {}

  ntpproto::TimeSpec NowUnix() override {
    std::lock_guard<std::mutex> lk(mtx_);
    return now_;
  }
  bool StepTime(double offset_s) override {
    std::lock_guard<std::mutex> lk(mtx_);
    if (refuse_) return false;
    now_ = ntpproto::AddSeconds(now_, offset_s);
    steps_.push_back(offset_s);
    return true;
  }
  bool SlewFrequency(double ppm) override {
    std::lock_guard<std::mutex> lk(mtx_);
    if (refuse_) return false;
    ppm_ = ppm;
    ++slews_;
    return true;
  }
  double GetFrequencyPpm() const override {
    std::lock_guard<std::mutex> lk(mtx_);
    return ppm_;
  }

  void Advance(double seconds) {
    std::lock_guard<std::mutex> lk(mtx_);
    now_ = ntpproto::AddSeconds(now_, seconds);
  }
  void SetRefuse(bool refuse) {
    std::lock_guard<std::mutex> lk(mtx_);
    refuse_ = refuse;
  }
  std::vector<double> Steps() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return steps_;
  }
  int Slews() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return slews_;
  }

 private:
  mutable std::mutex mtx_;
  ntpproto::TimeSpec now_;
  double ppm_ = 0.0;
  int slews_ = 0;
  bool refuse_ = false;
  std::vector<double> steps_;
};

/** Header fields a simulated server puts in its replies. */
struct ReplyParams {
  ntpproto::LeapIndicator leap = ntpproto::LeapIndicator::NoWarning;
  ntpproto::Mode mode = ntpproto::Mode::Server;
  uint8_t version = 4;
  uint8_t stratum = 1;
  int8_t precision = -20;
  double root_delay = 0.0;
  double root_dispersion = 0.0;
  uint32_t ref_id = ntpproto::MakeRefId('G', 'P', 'S', 0);
};

/**
 * Server whose clock is `offset` ahead of the client, reached over a
 * symmetric path with round-trip `delay`.
 */
struct SimulatedServer {
  double offset = 0.0;
  double delay = 0.01;
  ReplyParams params;

  /**
   * @brief Answer `request` sent at local time t1.
   * @param t4 Receives the local arrival time of the reply.
   */
  std::vector<uint8_t> Respond(const std::vector<uint8_t>& request,
                               const ntpproto::TimeSpec& t1,
                               ntpproto::TimeSpec* t4) const {
    ntpproto::NtpHeader req;
    if (!ntpproto::ParseHeader(request, &req)) return {};

    const ntpproto::TimeSpec t2 =
        ntpproto::AddSeconds(t1, delay / 2.0 + offset);
    const ntpproto::TimeSpec t3 = ntpproto::AddSeconds(t2, 0.0001);
    if (t4) *t4 = ntpproto::AddSeconds(t3, delay / 2.0 - offset);

    ntpproto::NtpHeader h;
    h.leap = params.leap;
    h.version = params.version;
    h.mode = params.mode;
    h.stratum = params.stratum;
    h.precision = params.precision;
    h.root_delay = params.root_delay;
    h.root_dispersion = params.root_dispersion;
    h.ref_id = params.ref_id;
    h.origin_ts = req.transmit_ts;
    h.receive_ts = t2.ToNtpTimestamp();
    h.transmit_ts = t3.ToNtpTimestamp();
    return ntpproto::SerializeHeader(h);
  }
};

/** A sample measured at local time t4 with the given offset and delay. */
inline ntpsync::Sample MakeTestSample(const ntpproto::TimeSpec& t4,
                                      double offset, double delay,
                                      double dispersion = 1e-6) {
  ntpsync::Sample s;
  s.t4 = t4;
  s.t1 = ntpproto::AddSeconds(t4, -delay);
  s.offset = offset;
  s.delay = delay;
  s.dispersion = dispersion;
  s.stratum = 1;
  return s;
}

}  // namespace ntpsync_test
