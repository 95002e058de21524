#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/model/feature_schema.hpp"
#include "internal/scoring/isolation_forest_model.hpp"

namespace bridgewatch::training {

struct TrainingOptions {
  std::vector<std::string>             features;
  scoring::IsolationForest::Options    forest;

  static TrainingOptions FromConfig(const bridgewatch::runtime::config::RuntimeConfig& config);
};

// Operator-facing summary of a fit. Nothing downstream depends on it.
struct TrainingDiagnostics {
  std::size_t rows          = 0;
  std::size_t anomalies     = 0;
  double      min_score     = 0.0;
  double      max_score     = 0.0;
  std::size_t imputed_cells = 0;
};

struct TrainingResult {
  std::shared_ptr<const scoring::IsolationForestModel> model;
  TrainingDiagnostics                                   diagnostics;
};

/*
  Fits the scoring model once from the full historical snapshot.

  Pipeline: median imputation, standardization, isolation forest. The
  returned model is immutable and is handed to the scoring loop as-is.
  An empty snapshot throws util::EmptyTrainingSet.
*/
class TrainingCoordinator {
 public:
  TrainingCoordinator(std::shared_ptr<db::Repository> repository, TrainingOptions options);

  // snapshot rows carry every stored channel; the model's features are projected out
  TrainingResult Train(const std::vector<db::model::TelemetryRecord>& snapshot) const;

  // Reads ListRecords in one transaction, then Train().
  TrainingResult TrainFromStore() const;

 private:
  std::shared_ptr<db::Repository> repository_;
  TrainingOptions                 options_;
  model::FeatureProjection        projection_;
};

} // namespace bridgewatch::training
