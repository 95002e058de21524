#include "internal/training/training_coordinator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using bridgewatch::db::memory::MemoryRepository;
using bridgewatch::db::model::TelemetryRecord;
using bridgewatch::model::FeatureSchema;
using bridgewatch::training::TrainingCoordinator;
using bridgewatch::training::TrainingOptions;

const std::vector<std::string> kChannels = {"strain_microstrain", "tilt_deg", "temperature_c", "wind_speed_ms"};

std::shared_ptr<MemoryRepository> MakeRepository(std::size_t rows, bool with_gaps) {
  auto repo = std::make_shared<MemoryRepository>(FeatureSchema("bridge_telemetry", kChannels));

  std::mt19937_64                  rng(5);
  std::normal_distribution<double> normal(10.0, 2.0);

  auto tx = repo->Begin();
  for (std::size_t i = 0; i < rows; ++i) {
    TelemetryRecord record;
    for (std::size_t c = 0; c < kChannels.size(); ++c) {
      record.features.push_back(normal(rng));
    }
    // every tenth row lost its tilt reading
    if (with_gaps && i % 10 == 0) record.features[1] = std::nullopt;
    auto inserted = repo->InsertRecord(*tx, record);
    assert(inserted);
  }
  tx->Commit();
  return repo;
}

TrainingOptions Options(std::vector<std::string> features) {
  TrainingOptions options;
  options.features             = std::move(features);
  options.forest.n_estimators  = 50;
  options.forest.contamination = 0.1;
  return options;
}

void TestEmptySnapshotIsFatal() {
  auto repo = MakeRepository(0, false);

  bool threw = false;
  try {
    (void)TrainingCoordinator(repo, Options({"strain_microstrain"})).TrainFromStore();
  } catch (const bridgewatch::util::EmptyTrainingSet&) {
    threw = true;
  }
  assert(threw && "training on an empty store must fail");
}

void TestTrainsOnProjectedFeatures() {
  auto repo    = MakeRepository(200, false);
  auto trained = TrainingCoordinator(repo, Options({"tilt_deg", "strain_microstrain"})).TrainFromStore();

  assert(trained.model);
  assert(trained.model->FeatureCount() == 2);
  assert(trained.model->FeatureNames()[0] == "tilt_deg");
  assert(trained.model->Forest().TreeCount() == 50);

  const auto& d = trained.diagnostics;
  assert(d.rows == 200);
  assert(d.imputed_cells == 0);
  assert(d.min_score <= d.max_score);
  // roughly the contamination share of the training rows
  assert(d.anomalies >= 15 && d.anomalies <= 25);
}

void TestMissingValuesAreImputed() {
  auto repo    = MakeRepository(100, true);
  auto trained = TrainingCoordinator(repo, Options({"strain_microstrain", "tilt_deg"})).TrainFromStore();

  assert(trained.diagnostics.imputed_cells == 10);

  // a row missing its tilt reading scores like one carrying the median
  const double median = trained.model->Imputer().Medians()[1];
  auto         gap    = trained.model->ScoreBatch({{10.0, std::nullopt}});
  auto         filled = trained.model->ScoreBatch({{10.0, median}});
  assert(gap.front().score == filled.front().score);
}

void TestTrainUsesGivenSnapshot() {
  auto repo = MakeRepository(50, false);

  std::vector<TelemetryRecord> snapshot;
  {
    auto tx  = repo->Begin();
    snapshot = repo->ListRecords(*tx);
    tx->Commit();
  }
  snapshot.resize(20);

  auto trained = TrainingCoordinator(repo, Options({"temperature_c"})).Train(snapshot);
  assert(trained.diagnostics.rows == 20);
  assert(trained.model->Forest().SubsampleSize() == 20);
}

void TestUnknownFeatureIsRejected() {
  auto repo  = MakeRepository(10, false);
  bool threw = false;
  try {
    TrainingCoordinator coordinator(repo, Options({"deflection_mm"}));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptySnapshotIsFatal();
  TestTrainsOnProjectedFeatures();
  TestMissingValuesAreImputed();
  TestTrainUsesGivenSnapshot();
  TestUnknownFeatureIsRejected();

  std::cout << "bridgewatch_unit_training_coordinator: pass\n";
  return 0;
}
