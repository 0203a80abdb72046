// Copyright (c) 2025 <Your Name>
/**
 * @file sync_engine.hpp
 * @brief Source table, synchronization round and clock discipline.
 *
 * SyncEngine owns the source sessions and the Discipline. It has no
 * threads of its own: SyncService drives it, and tests call RunRound()
 * directly with fake time.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ntpproto/time_source.hpp"
#include "ntpproto/time_spec.hpp"
#include "ntpsync/discipline.hpp"
#include "ntpsync/options.hpp"
#include "ntpsync/source_session.hpp"
#include "ntpsync/types.hpp"

namespace ntpsync {

/** @brief Everything one synchronization round decided. */
struct RoundResult {
  uint64_t round = 0;
  SystemStat system;
  Adjustment adjustment;
  std::vector<SourceId> candidates;  ///< Fit sources entering selection
  std::vector<SourceId> truechimers;
  std::vector<SourceId> falsetickers;
  std::vector<SourceId> survivors;
  std::string error;  ///< Empty when the round produced an estimate
};

/**
 * @brief Coordinates sources, selection, combining and the discipline.
 *
 * AddSource()/RemoveSource() are serialized by the table mutex. RunRound()
 * and Tick() are serialized by the round mutex and are the only paths to
 * the Discipline, so only their caller ever steps or slews the clock.
 */
class SyncEngine {
 public:
  /**
   * @param clock Clock to discipline; must outlive the engine.
   * @param opt Immutable options snapshot.
   */
  SyncEngine(ntpproto::TimeSource* clock, const Options& opt);

  SyncEngine(const SyncEngine&) = delete;
  SyncEngine& operator=(const SyncEngine&) = delete;

  /** Register a source; ids are never reused. */
  SourceId AddSource(const Endpoint& endpoint);

  /**
   * @brief Remove a source from the table.
   *
   * The session is flagged removed so a worker holding it stops; it takes
   * no part in later rounds.
   *
   * @return false if the id is unknown.
   */
  bool RemoveSource(SourceId id);

  /** Look up a live session; nullptr if unknown or removed. */
  std::shared_ptr<SourceSession> FindSource(SourceId id) const;

  /** All live sessions in ascending id order. */
  std::vector<std::shared_ptr<SourceSession>> Sources() const;

  /**
   * @brief Run selection, clustering, combining and the discipline once.
   *
   * @param now Current time of the disciplined clock.
   * @return Round outcome; `error` is set when no estimate was produced.
   * @test
   * @brief Falseticker is excluded.
   * @steps Three sources agree near +10 ms, a fourth reports -500 ms.
   * @expected The fourth is a falseticker, offset stays near +10 ms.
   */
  RoundResult RunRound(const ntpproto::TimeSpec& now);

  /** Amortize the residual phase (Discipline::Tick). */
  void Tick(const ntpproto::TimeSpec& now);

  /** Operator acknowledgement of a discipline alarm. */
  void ClearAlarm();

  SystemStat GetSystemStat() const;
  DisciplineState GetDisciplineState() const;
  RoundResult LastRound() const;
  uint64_t Rounds() const;

  /** Incremented after every step; older samples no longer count. */
  uint64_t ResetEpoch() const { return reset_epoch_->load(); }

  const Options& GetOptions() const { return opts_; }

 private:
  bool IsFit(const SourceSnapshot& snap, const ntpproto::TimeSpec& now,
             uint64_t epoch) const;
  void Log(LogLevel level, const std::string& text) const;

  const Options opts_;
  const SessionConfig session_config_;
  std::shared_ptr<std::atomic<uint64_t>> reset_epoch_;

  mutable std::mutex table_mtx_;
  std::map<SourceId, std::shared_ptr<SourceSession>> table_;
  SourceId next_id_ = 1;

  mutable std::mutex round_mtx_;
  Discipline discipline_;
  SystemStat system_;
  RoundResult last_round_;
  uint64_t rounds_ = 0;
};

}  // namespace ntpsync
