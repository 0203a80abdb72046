// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Threaded driver for SyncEngine.
 *
 * One worker per source polls on the session's schedule and feeds received
 * datagrams into the session. The round thread runs a round on a fixed
 * cadence, or early once enough sources have fresh estimates, and ticks
 * the discipline in between.
 */

#include "ntpsync/sync_service.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/udp_socket.hpp"
#include "ntpproto/platform/default_time_source.hpp"
#include "ntpsync/source_session.hpp"
#include "ntpsync/sync_engine.hpp"

using std::chrono::milliseconds;

namespace {
// Upper bound on a worker's idle wait so removal and Stop() are noticed.
constexpr int kMaxWorkerWaitMs = 200;
}  // namespace

// ---------------- Status ----------------
namespace ntpsync {
std::ostream& operator<<(std::ostream& os, const Status& s) {
  os << "sync=" << (s.synchronized ? "true" : "false")
     << ", offset=" << s.offset_s << "s"
     << ", jitter=" << s.jitter_s << "s"
     << ", stratum=" << s.stratum << ", mode=" << ToString(s.mode)
     << ", freq=" << s.frequency_ppm << "ppm"
     << ", last_corr=" << ToString(s.last_correction)
     << ", corr_amount=" << s.last_correction_amount_s
     << ", rounds=" << s.rounds << ", truechimers=" << s.truechimers
     << ", survivors=" << s.survivors << ", peer=" << s.system_peer
     << ", workers=" << s.workers;
  if (s.alarm) os << ", ALARM";
  if (!s.last_error.empty()) os << ", err='" << s.last_error << "'";
  return os;
}
}  // namespace ntpsync

// ---------------- Impl ----------------
struct ntpsync::SyncService::Impl {
  struct Worker {
    std::shared_ptr<SourceSession> session;
    internal::UdpSocket socket;
    std::thread thread;
  };

  // Set at Start, cleared at Stop
  std::atomic<ntpproto::TimeSource*> clock{nullptr};
  std::unique_ptr<ntpproto::TimeSource> owned_clock;
  std::shared_ptr<SyncEngine> engine;

  Options opts;
  mutable std::mutex opts_mtx;

  std::atomic<bool> running{false};

  std::mutex workers_mtx;
  std::map<SourceId, std::unique_ptr<Worker>> workers;

  // Round trigger
  std::thread round_thread;
  std::mutex round_mtx;
  std::condition_variable round_cv;
  std::set<SourceId> fresh;
  std::vector<SourceId> retired;  // demobilized, awaiting join

  // Status not kept by the engine
  mutable std::mutex status_mtx;
  Adjustment::Correction last_correction = Adjustment::Correction::None;
  double last_correction_amount_s = 0.0;
  std::string socket_last_error;

  LogCallback log_callback_;

  bool StartImpl(ntpproto::TimeSource* ts, const Options& opt);
  void StopImpl();
  bool StartWorker(const Endpoint& endpoint, SourceId* out_id);
  void WorkerLoop(Worker* w);
  std::unique_ptr<Worker> TakeWorker(SourceId id);
  static void JoinWorker(Worker* w);
  void ReapRetired();
  void RoundLoop();
  void NotifyFresh(SourceId id);
  void ReportSocketError(const std::string& msg);
  std::shared_ptr<SyncEngine> Engine() const { return std::atomic_load(&engine); }
  void Log(LogLevel level, const std::string& text) const;
};

bool ntpsync::SyncService::Impl::StartImpl(ntpproto::TimeSource* ts,
                                           const Options& opt) {
  {
    std::lock_guard<std::mutex> lk(opts_mtx);
    opts = opt;
  }
  log_callback_ = opt.LogSink();
  {
    std::lock_guard<std::mutex> lk(status_mtx);
    last_correction = Adjustment::Correction::None;
    last_correction_amount_s = 0.0;
    socket_last_error.clear();
  }
  clock.store(ts);
  std::atomic_store(&engine, std::make_shared<SyncEngine>(ts, opt));
  running.store(true, std::memory_order_release);

  for (const auto& ep : opt.Sources()) {
    if (!StartWorker(ep, nullptr)) {
      StopImpl();
      return false;
    }
  }

  std::ostringstream oss;
  oss << "started: " << opt;
  Log(LogLevel::Info, oss.str());

  round_thread = std::thread([this]() { RoundLoop(); });
  return true;
}

void ntpsync::SyncService::Impl::StopImpl() {
  running.store(false, std::memory_order_release);
  round_cv.notify_all();
  if (round_thread.joinable()) round_thread.join();

  std::map<SourceId, std::unique_ptr<Worker>> stopping;
  {
    std::lock_guard<std::mutex> lk(workers_mtx);
    stopping.swap(workers);
  }
  for (auto& kv : stopping) JoinWorker(kv.second.get());
  {
    std::lock_guard<std::mutex> lk(round_mtx);
    fresh.clear();
    retired.clear();
  }

  std::atomic_store(&engine, std::shared_ptr<SyncEngine>());
  clock.store(nullptr);
  owned_clock.reset();
}

bool ntpsync::SyncService::Impl::StartWorker(const Endpoint& endpoint,
                                             SourceId* out_id) {
  auto eng = Engine();
  ntpproto::TimeSource* ts = clock.load();
  if (!eng || !ts) return false;

  auto w = std::make_unique<Worker>();
  auto get_time = [ts]() { return ts->NowUnix(); };
  if (!w->socket.Open(endpoint.address, endpoint.port, get_time,
                      log_callback_)) {
    ReportSocketError("socket open failed for " + endpoint.address);
    return false;
  }

  const SourceId id = eng->AddSource(endpoint);
  w->session = eng->FindSource(id);
  {
    // Stop() swaps the table under this lock; a worker is only ever
    // published with its thread already running.
    std::lock_guard<std::mutex> lk(workers_mtx);
    if (running.load(std::memory_order_acquire)) {
      Worker* raw = w.get();
      raw->thread = std::thread([this, raw]() { WorkerLoop(raw); });
      workers.emplace(id, std::move(w));
    }
  }
  if (w) {
    eng->RemoveSource(id);
    w->socket.Close();
    return false;
  }
  if (out_id) *out_id = id;
  return true;
}

std::unique_ptr<ntpsync::SyncService::Impl::Worker>
ntpsync::SyncService::Impl::TakeWorker(SourceId id) {
  std::lock_guard<std::mutex> lk(workers_mtx);
  auto it = workers.find(id);
  if (it == workers.end()) return nullptr;
  std::unique_ptr<Worker> w = std::move(it->second);
  workers.erase(it);
  return w;
}

void ntpsync::SyncService::Impl::JoinWorker(Worker* w) {
  if (w->thread.joinable()) w->thread.join();
  w->socket.Close();
}

void ntpsync::SyncService::Impl::ReapRetired() {
  std::vector<SourceId> ids;
  {
    std::lock_guard<std::mutex> lk(round_mtx);
    ids.swap(retired);
  }
  for (SourceId id : ids) {
    std::unique_ptr<Worker> w = TakeWorker(id);
    if (!w) continue;  // RemoveSource() got there first
    JoinWorker(w.get());
    Log(LogLevel::Info, "source " + std::to_string(id) + " demobilized");
  }
}

void ntpsync::SyncService::Impl::WorkerLoop(Worker* w) {
  SourceSession& s = *w->session;
  ntpproto::TimeSource* ts = clock.load();
  const Options::AuthCallback auth = [this]() {
    std::lock_guard<std::mutex> lk(opts_mtx);
    return opts.AuthGate();
  }();

  while (running.load(std::memory_order_acquire) && !s.removed()) {
    // 1. Expire or start an exchange
    ntpproto::TimeSpec now = ts->NowUnix();
    s.CheckTimeout(now);
    if (!s.Awaiting() && now >= s.NextPollTime()) {
      std::vector<uint8_t> req = s.Poll(ts->NowUnix());
      if (!w->socket.Send(req)) {
        ReportSocketError("send failed to source " + std::to_string(s.id()));
      }
    }

    // 2. Wait for a datagram until the next deadline or poll
    now = ts->NowUnix();
    const ntpproto::TimeSpec target =
        s.Awaiting() ? s.Deadline() : s.NextPollTime();
    const double until_s = ntpproto::DiffSeconds(target, now);
    const int wait_ms = static_cast<int>(std::clamp(
        std::ceil(until_s * 1000.0), 1.0, static_cast<double>(kMaxWorkerWaitMs)));

    internal::UdpSocket::Message msg;
    if (!w->socket.WaitMessage(wait_ms, &msg)) continue;

    // 3. Authentication gate, then the session
    const bool auth_ok = !auth || auth(msg.data);
    bool is_fresh = false;
    s.HandlePacket(msg.data, msg.recv_time, auth_ok, &is_fresh);
    if (is_fresh) NotifyFresh(s.id());

    auto snap = s.Snapshot();
    if (snap && snap->demobilize) {
      auto eng = Engine();
      if (eng) eng->RemoveSource(s.id());
      {
        std::lock_guard<std::mutex> lk(round_mtx);
        retired.push_back(s.id());
      }
      round_cv.notify_one();
      break;
    }
  }
}

void ntpsync::SyncService::Impl::RoundLoop() {
  const Options snapshot = [&]() {
    std::lock_guard<std::mutex> lk(opts_mtx);
    return opts;
  }();
  const milliseconds tick(snapshot.TickMs());
  const milliseconds interval(snapshot.RoundIntervalMs());
  auto eng = Engine();
  ntpproto::TimeSource* ts = clock.load();
  auto next_round = std::chrono::steady_clock::now() + interval;

  while (running.load(std::memory_order_acquire)) {
    const size_t needed = std::min<size_t>(
        static_cast<size_t>(snapshot.Quorum()), eng->Sources().size());

    bool quorum = false;
    {
      std::unique_lock<std::mutex> lk(round_mtx);
      round_cv.wait_for(lk, tick, [&]() {
        return !running.load() || !retired.empty() ||
               (needed > 0 && fresh.size() >= needed);
      });
      quorum = needed > 0 && fresh.size() >= needed;
    }
    if (!running.load(std::memory_order_acquire)) break;
    ReapRetired();

    eng->Tick(ts->NowUnix());

    if (!quorum && std::chrono::steady_clock::now() < next_round) continue;
    {
      std::lock_guard<std::mutex> lk(round_mtx);
      fresh.clear();
    }
    next_round = std::chrono::steady_clock::now() + interval;

    RoundResult r = eng->RunRound(ts->NowUnix());
    if (r.adjustment.correction != Adjustment::Correction::None) {
      std::lock_guard<std::mutex> lk(status_mtx);
      last_correction = r.adjustment.correction;
      last_correction_amount_s = r.adjustment.amount_s;
    }
  }
}

void ntpsync::SyncService::Impl::NotifyFresh(SourceId id) {
  {
    std::lock_guard<std::mutex> lk(round_mtx);
    fresh.insert(id);
  }
  round_cv.notify_one();
}

void ntpsync::SyncService::Impl::ReportSocketError(const std::string& msg) {
  {
    std::lock_guard<std::mutex> lk(status_mtx);
    socket_last_error = msg;
  }
  Log(LogLevel::Warning, msg);
}

void ntpsync::SyncService::Impl::Log(LogLevel level,
                                     const std::string& text) const {
  if (log_callback_) log_callback_(level, "[SyncService] " + text);
}

// ---------------- SyncService ----------------
ntpsync::SyncService::SyncService() : p_(new Impl()) {}
ntpsync::SyncService::~SyncService() { Stop(); }

bool ntpsync::SyncService::Start(ntpproto::TimeSource* clock,
                                 const Options& opt) {
  if (!clock) return false;
  Stop();
  return p_->StartImpl(clock, opt);
}

bool ntpsync::SyncService::Start(const Options& opt) {
  Stop();
  p_->owned_clock = ntpproto::platform::CreateDefaultTimeSource();
  if (!p_->owned_clock) return false;
  return p_->StartImpl(p_->owned_clock.get(), opt);
}

void ntpsync::SyncService::Stop() {
  if (!p_->running.load() && !p_->round_thread.joinable()) return;
  p_->StopImpl();
  p_->Log(LogLevel::Info, "stopped");
}

bool ntpsync::SyncService::AddSource(const std::string& ip, uint16_t port,
                                     SourceId* out_id) {
  if (!p_->running.load()) return false;
  return p_->StartWorker(Endpoint(ip, port), out_id);
}

bool ntpsync::SyncService::RemoveSource(SourceId id) {
  auto eng = p_->Engine();
  const bool in_table = eng && eng->RemoveSource(id);

  std::unique_ptr<Impl::Worker> w = p_->TakeWorker(id);
  if (!w) return in_table;
  // The session is flagged removed; the worker leaves within one wait.
  Impl::JoinWorker(w.get());
  return true;
}

void ntpsync::SyncService::ClearAlarm() {
  auto eng = p_->Engine();
  if (eng) eng->ClearAlarm();
}

ntpproto::TimeSpec ntpsync::SyncService::NowUnix() const {
  ntpproto::TimeSource* ts = p_->clock.load();
  if (!ts) return ntpproto::TimeSpec{};
  return ts->NowUnix();
}

ntpsync::Status ntpsync::SyncService::GetStatus() const {
  Status st;
  auto eng = p_->Engine();
  if (!eng) return st;

  const SystemStat sys = eng->GetSystemStat();
  const DisciplineState d = eng->GetDisciplineState();
  const RoundResult last = eng->LastRound();

  st.synchronized = sys.synchronized;
  st.offset_s = sys.offset;
  st.jitter_s = sys.jitter;
  st.stratum = sys.stratum;
  st.leap = sys.leap;
  st.mode = d.mode;
  st.frequency_ppm = d.frequency_ppm;
  st.alarm = d.alarm;
  st.rounds = last.round;
  st.truechimers = sys.truechimers;
  st.survivors = sys.survivors;
  st.system_peer = sys.system_peer;
  st.last_error = last.error;
  {
    std::lock_guard<std::mutex> lk(p_->workers_mtx);
    st.workers = static_cast<int>(p_->workers.size());
  }
  {
    std::lock_guard<std::mutex> lk(p_->status_mtx);
    st.last_correction = p_->last_correction;
    st.last_correction_amount_s = p_->last_correction_amount_s;
    if (st.last_error.empty()) st.last_error = p_->socket_last_error;
  }

  for (const auto& s : eng->Sources()) {
    auto snap = s->Snapshot();
    if (!snap) continue;
    SourceStatus ss;
    ss.id = snap->id;
    ss.endpoint = snap->endpoint;
    ss.has_stat = snap->has_stat;
    ss.offset_s = snap->stat.offset;
    ss.delay_s = snap->stat.delay;
    ss.dispersion_s = snap->stat.dispersion;
    ss.jitter_s = snap->stat.jitter;
    ss.stratum = snap->stat.stratum;
    ss.poll_exponent = snap->poll.exponent;
    ss.reach = snap->poll.reach;
    ss.last_reject = snap->last_reject;
    ss.polls = snap->counters.polls;
    ss.valid = snap->counters.valid;
    ss.missed = snap->counters.missed;
    ss.survivor = std::count(last.survivors.begin(), last.survivors.end(),
                             snap->id) > 0;
    ss.falseticker = std::count(last.falsetickers.begin(),
                                last.falsetickers.end(), snap->id) > 0;
    st.sources.push_back(ss);
  }
  return st;
}

ntpsync::Options ntpsync::SyncService::GetOptions() const {
  std::lock_guard<std::mutex> lk(p_->opts_mtx);
  return p_->opts;
}

bool ntpsync::SyncService::IsRunning() const { return p_->running.load(); }
