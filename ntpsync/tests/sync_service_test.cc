// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Tests for Options and the threaded SyncService, using a loopback
 *        responder on 127.0.0.1.
 */
#include "ntpsync/sync_service.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "ntpproto/monotonic_clock.hpp"
#include "ntpproto/ntp_packet.hpp"
#include "ntpproto/platform/socket_interface.hpp"

using ntpsync::Options;
using ntpsync::Status;
using ntpsync::SyncService;

namespace {

/** Minimal NTP responder answering every request on one UDP port. */
class LoopbackResponder {
 public:
  LoopbackResponder(uint16_t port, double offset_s)
      : port_(port), offset_s_(offset_s) {}
  ~LoopbackResponder() { Stop(); }

  /** Reply with a kiss code (stratum 0) instead of time. */
  void SetKiss(uint32_t code) { kiss_ = code; }

  bool Start() {
    sock_ = ntpproto::platform::CreatePlatformSocket();
    if (!sock_ || !sock_->Initialize() || !sock_->Bind(port_)) return false;
    running_ = true;
    thread_ = std::thread([this]() { Loop(); });
    return true;
  }

  void Stop() {
    running_ = false;
    if (thread_.joinable()) thread_.join();
    if (sock_) sock_->Close();
  }

  int Requests() const { return requests_.load(); }

 private:
  void Loop() {
    while (running_) {
      if (!sock_->WaitReadable(100000)) continue;
      ntpproto::platform::Endpoint from;
      std::vector<uint8_t> data;
      if (!sock_->Receive(&from, &data, 1500)) continue;
      ntpproto::NtpHeader req;
      if (!ntpproto::ParseHeader(data, &req)) continue;
      ++requests_;

      const ntpproto::TimeSpec t2 =
          ntpproto::AddSeconds(clock_.NowUnix(), offset_s_);
      ntpproto::NtpHeader h;
      h.leap = ntpproto::LeapIndicator::NoWarning;
      h.version = 4;
      h.mode = ntpproto::Mode::Server;
      h.stratum = kiss_ ? 0 : 1;
      h.precision = -20;
      h.ref_id = kiss_ ? kiss_ : ntpproto::MakeRefId('L', 'O', 'C', 'L');
      h.origin_ts = req.transmit_ts;
      h.receive_ts = t2.ToNtpTimestamp();
      h.transmit_ts =
          ntpproto::AddSeconds(clock_.NowUnix(), offset_s_).ToNtpTimestamp();
      sock_->Send(from, ntpproto::SerializeHeader(h));
    }
  }

  const uint16_t port_;
  const double offset_s_;
  uint32_t kiss_ = 0;
  ntpproto::MonotonicClock clock_;
  std::unique_ptr<ntpproto::platform::ISocket> sock_;
  std::atomic<bool> running_{false};
  std::atomic<int> requests_{0};
  std::thread thread_;
};

/** Poll `pred` every 100 ms for up to `timeout`. */
template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  return pred();
}

}  // namespace

// ---------------- Options ----------------

TEST(OptionsTest, Defaults) {
  Options o = Options::Builder().Build();
  EXPECT_TRUE(o.Sources().empty());
  EXPECT_EQ(o.MinPoll(), 4);
  EXPECT_EQ(o.MaxPoll(), 10);
  EXPECT_EQ(o.WindowSize(), 8);
  EXPECT_DOUBLE_EQ(o.StepThresholdMs(), 128.0);
  EXPECT_DOUBLE_EQ(o.PanicThresholdS(), 1000.0);
  EXPECT_EQ(o.PanicLimit(), 3);
  EXPECT_DOUBLE_EQ(o.MaxDistanceMs(), 1500.0);
  EXPECT_EQ(o.Quorum(), 3);
  EXPECT_DOUBLE_EQ(o.PrecisionSeconds(), 1.0 / (1 << 20));
  EXPECT_FALSE(o.AuthGate());
}

/**
 * @test OptionsTest.BuilderClamps
 * @brief Out-of-range builder values are clamped, and MaxPoll never ends
 *        up below MinPoll.
 *
 * @steps
 * 1. Build with negative, oversized and inverted values.
 *
 * @expected Values land on the documented limits.
 */
TEST(OptionsTest, BuilderClamps) {
  Options o = Options::Builder()
                  .MinPoll(-3)
                  .MaxPoll(40)
                  .WindowSize(0)
                  .Quorum(0)
                  .TickMs(1)
                  .PanicLimit(-1)
                  .Build();
  EXPECT_EQ(o.MinPoll(), 0);
  EXPECT_EQ(o.MaxPoll(), Options::kMaxPollLimit);
  EXPECT_EQ(o.WindowSize(), 1);
  EXPECT_EQ(o.Quorum(), 1);
  EXPECT_EQ(o.TickMs(), 10);
  EXPECT_EQ(o.PanicLimit(), 1);

  Options inverted = Options::Builder().MinPoll(8).MaxPoll(5).Build();
  EXPECT_EQ(inverted.MinPoll(), 8);
  EXPECT_EQ(inverted.MaxPoll(), 8);

  EXPECT_EQ(Options::Builder().WindowSize(1000).Build().WindowSize(),
            Options::kMaxWindowSize);
}

TEST(OptionsTest, RebuildFromBase) {
  Options base = Options::Builder().AddSource("127.0.0.1", 123).Build();
  Options o = Options::Builder(base).MinPoll(6).Build();
  ASSERT_EQ(o.Sources().size(), 1u);
  EXPECT_EQ(o.Sources()[0].address, "127.0.0.1");
  EXPECT_EQ(o.MinPoll(), 6);
}

TEST(OptionsTest, StreamFormat) {
  std::ostringstream oss;
  oss << Options::Builder().AddSource("127.0.0.1", 123).Build();
  const std::string s = oss.str();
  EXPECT_NE(s.find("sources=1"), std::string::npos);
  EXPECT_NE(s.find("poll=[4,10]"), std::string::npos);
  EXPECT_NE(s.find("quorum=3"), std::string::npos);
}

// ---------------- SyncService ----------------

TEST(SyncServiceTest, StartRejectsNullClock) {
  SyncService svc;
  EXPECT_FALSE(svc.Start(nullptr, Options::Builder().Build()));
  EXPECT_FALSE(svc.IsRunning());
}

TEST(SyncServiceTest, StatusBeforeStart) {
  SyncService svc;
  Status st = svc.GetStatus();
  EXPECT_FALSE(st.synchronized);
  EXPECT_EQ(st.stratum, ntpsync::kMaxStratum);
  EXPECT_TRUE(st.sources.empty());
  EXPECT_EQ(svc.NowUnix(), ntpproto::TimeSpec());

  std::ostringstream oss;
  oss << st;
  EXPECT_NE(oss.str().find("sync=false"), std::string::npos);
}

/**
 * @test SyncServiceTest.StartStopWithUnreachableSource
 * @brief The service starts and stops cleanly when nothing answers.
 *
 * @steps
 * 1. Start with a TEST-NET-3 source and a short response timeout.
 * 2. Run for a moment, then Stop().
 *
 * @expected Running while started; source listed without a stat; stopped.
 */
TEST(SyncServiceTest, StartStopWithUnreachableSource) {
  ntpproto::MonotonicClock clock;
  SyncService svc;
  Options opt = Options::Builder()
                    .AddSource("203.0.113.1", 123)
                    .MinPoll(0)
                    .MaxPoll(0)
                    .ResponseTimeoutMs(100)
                    .Build();
  ASSERT_TRUE(svc.Start(&clock, opt));
  EXPECT_TRUE(svc.IsRunning());
  std::this_thread::sleep_for(std::chrono::milliseconds(300));

  Status st = svc.GetStatus();
  ASSERT_EQ(st.sources.size(), 1u);
  EXPECT_FALSE(st.sources[0].has_stat);
  EXPECT_FALSE(st.synchronized);
  EXPECT_GE(st.sources[0].polls, 1u);

  svc.Stop();
  EXPECT_FALSE(svc.IsRunning());
  svc.Stop();  // idempotent
}

TEST(SyncServiceTest, AddAndRemoveSourceWhileRunning) {
  ntpproto::MonotonicClock clock;
  SyncService svc;
  ntpsync::SourceId id = 0;
  EXPECT_FALSE(svc.AddSource("127.0.0.1", 29334, &id));

  ASSERT_TRUE(svc.Start(&clock, Options::Builder().Build()));
  ASSERT_TRUE(svc.AddSource("127.0.0.1", 29334, &id));
  EXPECT_EQ(id, 1u);
  EXPECT_EQ(svc.GetStatus().sources.size(), 1u);

  EXPECT_TRUE(svc.RemoveSource(id));
  EXPECT_TRUE(svc.GetStatus().sources.empty());
  EXPECT_FALSE(svc.RemoveSource(id));
  svc.Stop();
}

/**
 * @test SyncServiceTest.SynchronizesWithLoopbackResponder
 * @brief Full path over UDP: worker polls, filter fills, round runs and
 *        the discipline slews toward a responder 20 ms ahead.
 *
 * @steps
 * 1. Start a responder on 127.0.0.1:29333 with +20 ms offset.
 * 2. Start the service with 1 s polling, a 2-sample window, quorum 1.
 *
 * @expected Synchronized within 10 s with offset near +20 ms.
 */
TEST(SyncServiceTest, SynchronizesWithLoopbackResponder) {
  LoopbackResponder responder(29333, 0.020);
  ASSERT_TRUE(responder.Start());

  ntpproto::MonotonicClock clock;
  SyncService svc;
  Options opt = Options::Builder()
                    .AddSource("127.0.0.1", 29333)
                    .MinPoll(0)
                    .MaxPoll(0)
                    .WindowSize(2)
                    .Quorum(1)
                    .RoundIntervalMs(200)
                    .Build();
  ASSERT_TRUE(svc.Start(&clock, opt));

  EXPECT_TRUE(WaitFor([&svc]() { return svc.GetStatus().synchronized; },
                      std::chrono::seconds(10)));
  Status st = svc.GetStatus();
  EXPECT_GE(responder.Requests(), 2);
  EXPECT_NEAR(st.offset_s, 0.020, 0.010);
  EXPECT_EQ(st.stratum, 1);
  EXPECT_EQ(st.system_peer, 1u);
  ASSERT_EQ(st.sources.size(), 1u);
  EXPECT_TRUE(st.sources[0].has_stat);
  EXPECT_TRUE(st.sources[0].survivor);
  EXPECT_NE(st.last_correction, ntpsync::Adjustment::Correction::Step);

  svc.Stop();
  responder.Stop();
}

TEST(SyncServiceTest, DenyKissRemovesSource) {
  LoopbackResponder responder(29335, 0.0);
  responder.SetKiss(ntpproto::MakeRefId('D', 'E', 'N', 'Y'));
  ASSERT_TRUE(responder.Start());

  ntpproto::MonotonicClock clock;
  SyncService svc;
  Options opt = Options::Builder()
                    .AddSource("127.0.0.1", 29335)
                    .MinPoll(0)
                    .MaxPoll(0)
                    .Build();
  ASSERT_TRUE(svc.Start(&clock, opt));
  EXPECT_EQ(svc.GetStatus().workers, 1);
  EXPECT_TRUE(WaitFor([&svc]() { return svc.GetStatus().sources.empty(); },
                      std::chrono::seconds(5)));
  // The worker is joined and its socket closed without waiting for Stop().
  EXPECT_TRUE(WaitFor([&svc]() { return svc.GetStatus().workers == 0; },
                      std::chrono::seconds(5)));
  EXPECT_TRUE(svc.IsRunning());
  EXPECT_FALSE(svc.GetStatus().synchronized);

  svc.Stop();
  responder.Stop();
}

/**
 * @test SyncServiceTest.AddSourceRacingStop
 * @brief AddSource() on another thread while Stop() runs never leaves a
 *        worker behind.
 *
 * @steps
 * 1. Start with no sources.
 * 2. One thread adds sources until AddSource() fails; main calls Stop().
 *
 * @expected The adder terminates, no workers remain, and a later
 *           AddSource() is rejected.
 */
TEST(SyncServiceTest, AddSourceRacingStop) {
  ntpproto::MonotonicClock clock;
  SyncService svc;
  ASSERT_TRUE(svc.Start(&clock, Options::Builder().Build()));

  std::atomic<int> added{0};
  std::thread adder([&svc, &added]() {
    while (svc.AddSource("127.0.0.1", 29337)) {
      if (++added >= 64) break;
    }
  });
  WaitFor([&added]() { return added.load() >= 3; }, std::chrono::seconds(5));
  svc.Stop();
  adder.join();

  EXPECT_FALSE(svc.IsRunning());
  EXPECT_EQ(svc.GetStatus().workers, 0);
  EXPECT_FALSE(svc.AddSource("127.0.0.1", 29337));
}

TEST(SyncServiceTest, AuthGateRejectsEverything) {
  LoopbackResponder responder(29336, 0.0);
  ASSERT_TRUE(responder.Start());

  ntpproto::MonotonicClock clock;
  SyncService svc;
  Options opt = Options::Builder()
                    .AddSource("127.0.0.1", 29336)
                    .MinPoll(0)
                    .MaxPoll(0)
                    .Quorum(1)
                    .AuthGate([](const std::vector<uint8_t>&) { return false; })
                    .Build();
  ASSERT_TRUE(svc.Start(&clock, opt));
  EXPECT_TRUE(WaitFor(
      [&svc]() {
        Status st = svc.GetStatus();
        return !st.sources.empty() && st.sources[0].missed >= 1;
      },
      std::chrono::seconds(5)));
  Status st = svc.GetStatus();
  ASSERT_EQ(st.sources.size(), 1u);
  EXPECT_FALSE(st.sources[0].has_stat);
  EXPECT_EQ(st.sources[0].last_reject,
            ntpsync::RejectReason::AuthenticationFailure);

  svc.Stop();
  responder.Stop();
}
