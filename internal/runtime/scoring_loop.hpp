#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/model/feature_schema.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/runtime/cancellation.hpp"
#include "internal/scoring/scoring_model.hpp"

namespace bridgewatch::runtime {

struct ScoringLoopOptions {
  std::size_t               batch_size = 100;
  std::chrono::milliseconds poll_interval{2000};
  std::uint32_t             idle_report_every = 10;

  static ScoringLoopOptions FromConfig(const bridgewatch::runtime::config::RuntimeConfig& config);
};

struct LoopTotals {
  std::uint64_t cycles = 0;
  std::uint64_t scored = 0;
  // anomalies labelled by this process
  std::uint64_t flagged = 0;
  // COUNT of anomalous rows in the store, re-read after every cycle that scored
  std::uint64_t store_anomalies    = 0;
  std::uint64_t reconnect_attempts = 0;
  std::uint64_t failed_reconnects  = 0;
  std::uint64_t failed_cycles      = 0;
};

enum class CycleOutcome {
  kIdle,
  kScored,
  // non-connectivity store error; batch rolled back, retried next cycle
  kRolledBack,
  // connectivity lost; reconnect attempted (or not allowed this cycle)
  kConnectionLost,
  kReconnectFailed,
};

/*
  Continuous scoring loop.

  One cycle:
    RECONNECTING -> one reconnect attempt; on success continue as CONNECTED
    CONNECTED    -> fetch up to batch_size pending rows, score, apply all
                    outcomes and commit in one transaction, then re-read the
                    store's anomaly count

  A connectivity failure closes and reopens the connection immediately unless
  this cycle already spent its reconnect attempt. Other store errors roll the
  batch back and the next cycle retries it. Anything else (model width
  mismatch and other logic errors) stops the loop and propagates out of Run().

  Stop requests are observed only at the top of a cycle, so an in-flight
  batch always finishes.
*/
class ScoringLoop {
 public:
  ScoringLoop(std::shared_ptr<db::Repository> repository, std::shared_ptr<const scoring::ScoringModel> model,
              bridgewatch::model::FeatureProjection projection, ScoringLoopOptions options, const CancellationToken& token,
              Sleeper sleeper = {});

  // Cycles until stop is requested, sleeping poll_interval after every cycle.
  LoopTotals Run();

  // One cycle, no sleep.
  CycleOutcome RunCycle();

  bridgewatch::model::LoopState State() const { return state_; }
  const LoopTotals&             Totals() const { return totals_; }

 private:
  CycleOutcome ScoreBatch();
  bool         TryReconnect(const char* reason);
  void         Transition(bridgewatch::model::LoopState next);
  void         ReportIdle() const;
  void         ReportTotals(const char* message) const;

  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<const scoring::ScoringModel> model_;
  bridgewatch::model::FeatureProjection        projection_;
  ScoringLoopOptions                           options_;
  const CancellationToken&                     token_;
  Sleeper                                      sleeper_;

  bridgewatch::model::LoopState state_ = bridgewatch::model::LoopState::kConnected;
  LoopTotals                    totals_;
};

} // namespace bridgewatch::runtime
