// Copyright (c) 2025 The NTP Sample Authors
/**
 * @file sync_engine.cc
 * @brief Source table and synchronization round.
 */
#include "ntpsync/sync_engine.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "ntpsync/cluster.hpp"
#include "ntpsync/combine.hpp"
#include "ntpsync/poll_scheduler.hpp"
#include "ntpsync/selection.hpp"

namespace ntpsync {

namespace {

DisciplineConfig MakeDisciplineConfig(const Options& opt) {
  DisciplineConfig c;
  c.step_threshold_s = opt.StepThresholdMs() / 1000.0;
  c.panic_threshold_s = opt.PanicThresholdS();
  c.panic_limit = opt.PanicLimit();
  c.cooldown_s = opt.CooldownS();
  c.acquire_interval_s = opt.AcquireIntervalS();
  c.max_frequency_ppm = opt.MaxFrequencyPpm();
  c.jitter_reference_s = opt.JitterReferenceMs() / 1000.0;
  return c;
}

bool Contains(const std::vector<SourceId>& ids, SourceId id) {
  return std::binary_search(ids.begin(), ids.end(), id);
}

std::string JoinIds(const std::vector<SourceId>& ids) {
  std::ostringstream oss;
  oss << "[";
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i) oss << ",";
    oss << ids[i];
  }
  oss << "]";
  return oss.str();
}

}  // namespace

SyncEngine::SyncEngine(ntpproto::TimeSource* clock, const Options& opt)
    : opts_(opt),
      session_config_(SessionConfig::FromOptions(opt)),
      reset_epoch_(std::make_shared<std::atomic<uint64_t>>(0)),
      discipline_(clock, MakeDisciplineConfig(opt), opt.LogSink()) {}

SourceId SyncEngine::AddSource(const Endpoint& endpoint) {
  std::shared_ptr<SourceSession> session;
  {
    std::lock_guard<std::mutex> lk(table_mtx_);
    const SourceId id = next_id_++;
    session = std::make_shared<SourceSession>(id, endpoint, session_config_,
                                              reset_epoch_, opts_.LogSink());
    table_.emplace(id, session);
  }
  std::ostringstream oss;
  oss << "added source " << session->id() << " " << endpoint.address << ":"
      << endpoint.port;
  Log(LogLevel::Info, oss.str());
  return session->id();
}

bool SyncEngine::RemoveSource(SourceId id) {
  std::shared_ptr<SourceSession> session;
  {
    std::lock_guard<std::mutex> lk(table_mtx_);
    auto it = table_.find(id);
    if (it == table_.end()) return false;
    session = it->second;
    table_.erase(it);
  }
  session->MarkRemoved();
  Log(LogLevel::Info, "removed source " + std::to_string(id));
  return true;
}

std::shared_ptr<SourceSession> SyncEngine::FindSource(SourceId id) const {
  std::lock_guard<std::mutex> lk(table_mtx_);
  auto it = table_.find(id);
  if (it == table_.end()) return nullptr;
  return it->second;
}

std::vector<std::shared_ptr<SourceSession>> SyncEngine::Sources() const {
  std::lock_guard<std::mutex> lk(table_mtx_);
  std::vector<std::shared_ptr<SourceSession>> out;
  out.reserve(table_.size());
  for (const auto& kv : table_) out.push_back(kv.second);
  return out;
}

bool SyncEngine::IsFit(const SourceSnapshot& snap,
                       const ntpproto::TimeSpec& now, uint64_t epoch) const {
  if (!snap.has_stat || snap.epoch != epoch) return false;
  if (!PollScheduler::IsReachable(snap.poll)) return false;
  if (snap.stat.stratum >= kMaxStratum) return false;
  if (snap.stat.leap == ntpproto::LeapIndicator::Unsynchronized) return false;
  const FilteredStat aged = AgeFilteredStat(snap.stat, now);
  return aged.dispersion < opts_.MaxDistanceMs() / 1000.0;
}

RoundResult SyncEngine::RunRound(const ntpproto::TimeSpec& now) {
  std::lock_guard<std::mutex> lk(round_mtx_);
  RoundResult result;
  result.round = ++rounds_;

  // 1. Snapshot every live session, ids ascending.
  const uint64_t epoch = reset_epoch_->load();
  const std::vector<std::shared_ptr<SourceSession>> sessions = Sources();
  std::map<SourceId, std::shared_ptr<const SourceSnapshot>> snaps;
  std::vector<Candidate> candidates;
  for (const auto& s : sessions) {
    auto snap = s->Snapshot();
    if (!snap || !IsFit(*snap, now, epoch)) continue;
    snaps.emplace(snap->id, snap);
    Candidate c;
    c.id = snap->id;
    c.stat = AgeFilteredStat(snap->stat, now);
    candidates.push_back(c);
    result.candidates.push_back(c.id);
  }

  // 2. Intersection.
  SelectionResult sel = SelectTruechimers(candidates);
  result.truechimers = sel.truechimers;
  result.falsetickers = sel.falsetickers;

  if (sel.truechimers.empty()) {
    result.error =
        candidates.empty() ? "no usable sources" : "insufficient truechimers";
    system_.synchronized = false;
    result.system = system_;
    // The round failed; candidates poll sooner.
    auto fb = std::make_shared<RoundFeedback>();
    fb->round = result.round;
    for (const auto& s : sessions) {
      if (snaps.count(s->id())) s->PostRoundFeedback(fb);
    }
    std::ostringstream oss;
    oss << "round " << result.round << ": " << result.error
        << " (candidates=" << candidates.size() << ")";
    Log(LogLevel::Warning, oss.str());
    last_round_ = result;
    return result;
  }

  // 3. Cluster and combine.
  std::vector<Candidate> chimers;
  for (const auto& c : candidates) {
    if (Contains(sel.truechimers, c.id)) chimers.push_back(c);
  }
  const std::vector<Candidate> survivors = ClusterSurvivors(chimers);
  for (const auto& c : survivors) result.survivors.push_back(c.id);

  SystemStat stat = Combine(survivors);
  stat.truechimers = static_cast<int>(sel.truechimers.size());
  stat.update_time = now;

  // 4. Discipline.
  int poll_exponent = opts_.MinPoll();
  auto peer = snaps.find(stat.system_peer);
  if (peer != snaps.end()) poll_exponent = peer->second->poll.exponent;
  result.adjustment = discipline_.Update(stat, now, poll_exponent);
  if (result.adjustment.correction == Adjustment::Correction::Step) {
    reset_epoch_->fetch_add(1);
  }

  const DisciplineState dstate = discipline_.State();
  stat.synchronized = stat.synchronized && !dstate.alarm &&
                      result.adjustment.correction !=
                          Adjustment::Correction::Refused;
  if (stat.synchronized) {
    system_ = stat;
  } else {
    // Hold the last good estimate.
    system_.synchronized = false;
    if (result.error.empty()) {
      result.error = dstate.alarm ? "discipline alarm" : "correction refused";
    }
  }
  result.system = system_;

  // 5. Poll feedback.
  const double effective_jitter =
      std::max(std::sqrt(stat.jitter * stat.jitter +
                         stat.peer_jitter * stat.peer_jitter),
               session_config_.local_precision_s);
  auto fb = std::make_shared<RoundFeedback>();
  fb->round = result.round;
  fb->low_jitter = IsLowJitterRound(stat.offset, effective_jitter);
  auto lost = std::make_shared<RoundFeedback>(*fb);
  fb->survived = true;
  for (const auto& s : sessions) {
    if (!snaps.count(s->id())) continue;
    s->PostRoundFeedback(Contains(result.survivors, s->id()) ? fb : lost);
  }

  std::ostringstream oss;
  oss << "round " << result.round << ": offset=" << stat.offset
      << "s jitter=" << stat.jitter << "s peer=" << stat.system_peer
      << " truechimers=" << JoinIds(result.truechimers)
      << " falsetickers=" << JoinIds(result.falsetickers)
      << " survivors=" << JoinIds(result.survivors)
      << " correction=" << ToString(result.adjustment.correction);
  Log(LogLevel::Debug, oss.str());

  last_round_ = result;
  return result;
}

void SyncEngine::Tick(const ntpproto::TimeSpec& now) {
  std::lock_guard<std::mutex> lk(round_mtx_);
  discipline_.Tick(now);
}

void SyncEngine::ClearAlarm() {
  std::lock_guard<std::mutex> lk(round_mtx_);
  discipline_.ClearAlarm();
}

SystemStat SyncEngine::GetSystemStat() const {
  std::lock_guard<std::mutex> lk(round_mtx_);
  return system_;
}

DisciplineState SyncEngine::GetDisciplineState() const {
  std::lock_guard<std::mutex> lk(round_mtx_);
  return discipline_.State();
}

RoundResult SyncEngine::LastRound() const {
  std::lock_guard<std::mutex> lk(round_mtx_);
  return last_round_;
}

uint64_t SyncEngine::Rounds() const {
  std::lock_guard<std::mutex> lk(round_mtx_);
  return rounds_;
}

void SyncEngine::Log(LogLevel level, const std::string& text) const {
  const auto& sink = opts_.LogSink();
  if (sink) sink(level, "[SyncEngine] " + text);
}

}  // namespace ntpsync
