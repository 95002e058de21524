#include "internal/runtime/scoring_loop.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace bridgewatch::runtime {

using bridgewatch::model::LoopState;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

std::int64_t AsInt(std::uint64_t v) {
  return static_cast<std::int64_t>(v);
}

} // namespace

ScoringLoopOptions ScoringLoopOptions::FromConfig(const bridgewatch::runtime::config::RuntimeConfig& config) {
  ScoringLoopOptions options;
  options.batch_size        = config.scoring().batch_size();
  options.poll_interval     = util::SecondsToMillis(config.scoring().poll_interval_sec());
  options.idle_report_every = config.scoring().idle_report_every();
  return options;
}

ScoringLoop::ScoringLoop(std::shared_ptr<db::Repository> repository, std::shared_ptr<const scoring::ScoringModel> model,
                         bridgewatch::model::FeatureProjection projection, ScoringLoopOptions options, const CancellationToken& token,
                         Sleeper sleeper)
    : repository_(std::move(repository)),
      model_(std::move(model)),
      projection_(std::move(projection)),
      options_(options),
      token_(token),
      sleeper_(std::move(sleeper)) {
  if (!repository_ || !model_) {
    throw std::invalid_argument("scoring loop needs a repository and a trained model");
  }
  if (options_.batch_size == 0) {
    throw std::invalid_argument("batch size must be positive");
  }
  if (model_->FeatureCount() != projection_.Width()) {
    throw std::invalid_argument("model expects " + std::to_string(model_->FeatureCount()) + " features, projection yields " +
                                std::to_string(projection_.Width()));
  }
  if (!sleeper_) {
    sleeper_ = InterruptibleSleeper(token_);
  }
}

void ScoringLoop::Transition(LoopState next) {
  if (!bridgewatch::model::CanTransition(state_, next)) {
    throw util::InvalidState(std::string("scoring loop cannot move from ") + bridgewatch::model::ToString(state_) + " to " +
                             bridgewatch::model::ToString(next));
  }
  if (state_ != next) {
    BRIDGEWATCH_LOG_DEBUG("Scoring loop state", {StringField("from", bridgewatch::model::ToString(state_)),
                                                 StringField("to", bridgewatch::model::ToString(next))});
  }
  state_ = next;
}

LoopTotals ScoringLoop::Run() {
  BRIDGEWATCH_LOG_INFO("Scoring loop started", {IntField("batch_size", AsInt(options_.batch_size)),
                                                IntField("poll_interval_ms", options_.poll_interval.count())});

  try {
    while (!token_.StopRequested()) {
      RunCycle();
      sleeper_(options_.poll_interval);
    }
  } catch (const std::exception& e) {
    BRIDGEWATCH_LOG_ERROR("Scoring loop aborted", {StringField("error", e.what()), IntField("cycle", AsInt(totals_.cycles))});
    Transition(LoopState::kStopping);
    repository_->ConnectionHandle().Close();
    Transition(LoopState::kStopped);
    ReportTotals("Scoring loop stopped after error");
    throw;
  }

  Transition(LoopState::kStopping);
  repository_->ConnectionHandle().Close();
  Transition(LoopState::kStopped);
  ReportTotals("Scoring loop stopped");
  return totals_;
}

CycleOutcome ScoringLoop::RunCycle() {
  ++totals_.cycles;

  bool reconnected_this_cycle = false;
  if (state_ == LoopState::kReconnecting) {
    if (!TryReconnect("retry")) {
      return CycleOutcome::kReconnectFailed;
    }
    reconnected_this_cycle = true;
  }

  try {
    return ScoreBatch();
  } catch (const db::StoreError& e) {
    if (!db::IsConnectivityError(e.Code())) {
      ++totals_.failed_cycles;
      BRIDGEWATCH_LOG_WARN("Scoring cycle rolled back", {StringField("error", e.what()), StringField("code", db::ToString(e.Code())),
                                                         IntField("cycle", AsInt(totals_.cycles))});
      return CycleOutcome::kRolledBack;
    }

    ++totals_.failed_cycles;
    BRIDGEWATCH_LOG_ERROR("Store connection lost", {StringField("error", e.what()), IntField("cycle", AsInt(totals_.cycles))});
    if (reconnected_this_cycle) {
      Transition(LoopState::kReconnecting);
      return CycleOutcome::kConnectionLost;
    }
    return TryReconnect("connection lost") ? CycleOutcome::kConnectionLost : CycleOutcome::kReconnectFailed;
  }
}

CycleOutcome ScoringLoop::ScoreBatch() {
  const auto started = std::chrono::steady_clock::now();

  std::vector<db::model::TelemetryRecord> batch;
  std::vector<scoring::Verdict>           verdicts;
  {
    auto tx = repository_->Begin();
    batch   = repository_->FetchPending(*tx, options_.batch_size);

    if (batch.empty()) {
      tx->Commit();
      if (options_.idle_report_every > 0 && totals_.cycles % options_.idle_report_every == 0) {
        ReportIdle();
      }
      return CycleOutcome::kIdle;
    }

    observability::SpanScope span("scoring.cycle");
    span.SetAttribute("batch", AsInt(batch.size()));

    std::vector<bridgewatch::model::FeatureRow> rows;
    rows.reserve(batch.size());
    for (const auto& record : batch) {
      rows.push_back(projection_.Project(record.features));
    }

    verdicts = model_->ScoreBatch(rows);
    if (verdicts.size() != batch.size()) {
      throw std::logic_error("model returned " + std::to_string(verdicts.size()) + " verdicts for " + std::to_string(batch.size()) + " rows");
    }

    std::vector<db::model::OutcomeUpdate> updates;
    updates.reserve(batch.size());
    for (std::size_t i = 0; i < batch.size(); ++i) {
      updates.push_back(db::model::OutcomeUpdate{batch[i].id, verdicts[i].is_anomaly, verdicts[i].score});
    }

    auto applied = repository_->ApplyOutcomes(*tx, updates);
    if (!applied) {
      span.MarkFailed(db::ToString(applied.code));
      tx->Rollback();
      db::Throw(applied, "apply outcomes");
    }
    tx->Commit();
  }

  std::uint64_t flagged = 0;
  for (const auto& verdict : verdicts) {
    if (verdict.is_anomaly) ++flagged;
  }
  totals_.scored += batch.size();
  totals_.flagged += flagged;

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordScored(true, flagged);
  metrics.RecordScored(false, batch.size() - flagged);
  metrics.ObserveCycleLatencyMs(std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count());

  {
    auto tx                 = repository_->Begin();
    totals_.store_anomalies = repository_->CountAnomalies(*tx);
    tx->Commit();
  }
  metrics.SetAnomalyTotal(totals_.store_anomalies);

  BRIDGEWATCH_LOG_INFO("Scored batch", {IntField("cycle", AsInt(totals_.cycles)), IntField("scored", AsInt(batch.size())),
                                        IntField("anomalies", AsInt(flagged)), IntField("total_scored", AsInt(totals_.scored)),
                                        IntField("total_anomalies", AsInt(totals_.store_anomalies)),
                                        IntField("first_id", batch.front().id), IntField("last_id", batch.back().id)});
  return CycleOutcome::kScored;
}

bool ScoringLoop::TryReconnect(const char* reason) {
  ++totals_.reconnect_attempts;
  auto& connection = repository_->ConnectionHandle();
  try {
    connection.Close();
    connection.Reconnect();
  } catch (const db::StoreError& e) {
    ++totals_.failed_reconnects;
    observability::Metrics::Instance().RecordReconnect(false);
    Transition(LoopState::kReconnecting);
    BRIDGEWATCH_LOG_WARN("Reconnect failed, retrying next cycle", {StringField("reason", reason), StringField("error", e.what()),
                                                                   IntField("attempt", AsInt(totals_.reconnect_attempts))});
    return false;
  }

  observability::Metrics::Instance().RecordReconnect(true);
  Transition(LoopState::kConnected);
  BRIDGEWATCH_LOG_INFO("Reconnected to record store", {StringField("reason", reason), IntField("attempt", AsInt(totals_.reconnect_attempts))});
  return true;
}

void ScoringLoop::ReportIdle() const {
  BRIDGEWATCH_LOG_INFO("Waiting for new data", {IntField("cycle", AsInt(totals_.cycles)), IntField("total_scored", AsInt(totals_.scored)),
                                                IntField("total_anomalies", AsInt(totals_.store_anomalies))});
}

void ScoringLoop::ReportTotals(const char* message) const {
  BRIDGEWATCH_LOG_INFO(message, {IntField("cycles", AsInt(totals_.cycles)), IntField("total_scored", AsInt(totals_.scored)),
                                 IntField("flagged", AsInt(totals_.flagged)), IntField("total_anomalies", AsInt(totals_.store_anomalies)),
                                 IntField("reconnect_attempts", AsInt(totals_.reconnect_attempts)),
                                 BoolField("stop_requested", token_.StopRequested())});
}

} // namespace bridgewatch::runtime
