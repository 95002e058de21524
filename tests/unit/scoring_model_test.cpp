#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/runtime/cancellation.hpp"
#include "internal/runtime/scoring_loop.hpp"
#include "internal/scoring/isolation_forest_model.hpp"
#include "internal/training/training_coordinator.hpp"

namespace {

using bridgewatch::db::memory::MemoryRepository;
using bridgewatch::db::model::TelemetryRecord;
using bridgewatch::model::FeatureProjection;
using bridgewatch::model::FeatureRow;
using bridgewatch::model::FeatureSchema;
using bridgewatch::runtime::CancellationToken;
using bridgewatch::runtime::CycleOutcome;
using bridgewatch::runtime::ScoringLoop;
using bridgewatch::runtime::ScoringLoopOptions;
using bridgewatch::training::TrainingCoordinator;
using bridgewatch::training::TrainingOptions;

const std::vector<std::string>& Features() {
  return bridgewatch::model::DefaultModelFeatures();
}

std::vector<FeatureRow> TrainingRows(std::size_t n) {
  std::mt19937_64                  rng(11);
  std::normal_distribution<double> normal(50.0, 5.0);

  std::vector<FeatureRow> rows(n, FeatureRow(Features().size()));
  for (auto& row : rows) {
    for (auto& v : row) v = normal(rng);
  }
  return rows;
}

std::shared_ptr<MemoryRepository> SeededRepository(const std::vector<FeatureRow>& rows) {
  auto repo = std::make_shared<MemoryRepository>(FeatureSchema("bridge_telemetry", Features()));
  auto tx   = repo->Begin();
  for (const auto& row : rows) {
    TelemetryRecord record;
    record.features = row;
    auto inserted   = repo->InsertRecord(*tx, record);
    assert(inserted);
  }
  tx->Commit();
  return repo;
}

TrainingOptions Options() {
  TrainingOptions options;
  options.features             = Features();
  options.forest.n_estimators  = 100;
  options.forest.contamination = 0.05;
  options.forest.seed          = 42;
  return options;
}

void TestScoreBatchPreservesOrder() {
  auto rows    = TrainingRows(200);
  auto repo    = SeededRepository(rows);
  auto trained = TrainingCoordinator(repo, Options()).TrainFromStore();

  std::vector<FeatureRow> batch(rows.begin(), rows.begin() + 20);
  batch.push_back(FeatureRow(Features().size(), 500.0));
  batch.push_back(FeatureRow(Features().size(), std::nullopt));

  auto forward = trained.model->ScoreBatch(batch);
  assert(forward.size() == batch.size());

  std::vector<FeatureRow> reversed(batch.rbegin(), batch.rend());
  auto                    backward = trained.model->ScoreBatch(reversed);

  for (std::size_t i = 0; i < batch.size(); ++i) {
    const auto& a = forward[i];
    const auto& b = backward[batch.size() - 1 - i];
    assert(a.score == b.score);
    assert(a.is_anomaly == b.is_anomaly);

    auto single = trained.model->ScoreBatch({batch[i]});
    assert(single.front().score == a.score);
  }

  // label is exactly decision < 0
  for (const auto& verdict : forward) {
    assert(verdict.is_anomaly == (verdict.score < 0.0));
  }
  assert(forward[20].is_anomaly);
}

void TestScoreBatchRejectsWrongWidth() {
  auto repo    = SeededRepository(TrainingRows(50));
  auto trained = TrainingCoordinator(repo, Options()).TrainFromStore();
  assert(trained.model->FeatureCount() == Features().size());

  bool threw = false;
  try {
    (void)trained.model->ScoreBatch({FeatureRow{1.0, 2.0}});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestExtremeRecordIsFlaggedAfterOneCycle() {
  const auto rows  = TrainingRows(300);
  const auto width = Features().size();

  std::vector<double> mean(width, 0.0);
  std::vector<double> max(width, 0.0);
  for (const auto& row : rows) {
    for (std::size_t f = 0; f < width; ++f) {
      mean[f] += *row[f] / static_cast<double>(rows.size());
      max[f] = std::max(max[f], *row[f]);
    }
  }

  auto history = SeededRepository(rows);
  auto trained = TrainingCoordinator(history, Options()).TrainFromStore();

  auto repo = std::make_shared<MemoryRepository>(history->Schema());

  // ten new pending records at the training mean, the fifth at 10x the training max
  std::vector<int64_t> ids;
  {
    auto tx = repo->Begin();
    for (int i = 1; i <= 10; ++i) {
      TelemetryRecord record;
      for (std::size_t f = 0; f < width; ++f) {
        record.features.push_back(i == 5 ? 10.0 * max[f] : mean[f]);
      }
      auto inserted = repo->InsertRecord(*tx, record);
      assert(inserted);
      ids.push_back(record.id);
    }
    tx->Commit();
  }

  CancellationToken  token;
  ScoringLoopOptions loop_options;
  ScoringLoop        loop(repo, trained.model, FeatureProjection(repo->Schema(), Features()), loop_options, token,
                          [](std::chrono::milliseconds) {});
  assert(loop.RunCycle() == CycleOutcome::kScored);

  auto tx = repo->Begin();
  assert(repo->CountPending(*tx) == 0);

  const auto extreme = repo->GetRecord(*tx, ids[4]);
  assert(extreme && extreme->outcome);
  assert(extreme->outcome->is_anomaly);

  for (std::size_t i = 0; i < ids.size(); ++i) {
    if (i == 4) continue;
    const auto normal = repo->GetRecord(*tx, ids[i]);
    assert(normal && normal->outcome);
    assert(!normal->outcome->is_anomaly);
    assert(extreme->outcome->anomaly_score < normal->outcome->anomaly_score);
  }
}

} // namespace

int main() {
  TestScoreBatchPreservesOrder();
  TestScoreBatchRejectsWrongWidth();
  TestExtremeRecordIsFlaggedAfterOneCycle();

  std::cout << "bridgewatch_unit_scoring_model: pass\n";
  return 0;
}
