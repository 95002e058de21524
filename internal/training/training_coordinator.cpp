#include "internal/training/training_coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <limits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace bridgewatch::training {

TrainingOptions TrainingOptions::FromConfig(const bridgewatch::runtime::config::RuntimeConfig& config) {
  const auto&     model = config.model();
  TrainingOptions options;
  options.features.assign(model.features().begin(), model.features().end());
  options.forest.n_estimators  = model.n_estimators();
  options.forest.max_samples   = model.max_samples();
  options.forest.contamination = model.contamination();
  options.forest.seed          = model.random_seed();
  return options;
}

TrainingCoordinator::TrainingCoordinator(std::shared_ptr<db::Repository> repository, TrainingOptions options)
    : repository_(std::move(repository)), options_(std::move(options)), projection_(repository_->Schema(), options_.features) {
}

TrainingResult TrainingCoordinator::TrainFromStore() const {
  std::vector<db::model::TelemetryRecord> snapshot;
  {
    auto tx  = repository_->Begin();
    snapshot = repository_->ListRecords(*tx);
    tx->Commit();
  }
  BRIDGEWATCH_LOG_INFO("Loaded training snapshot", {observability::IntField("rows", static_cast<std::int64_t>(snapshot.size())),
                                                    observability::StringField("table", repository_->Schema().Table())});
  return Train(snapshot);
}

TrainingResult TrainingCoordinator::Train(const std::vector<db::model::TelemetryRecord>& snapshot) const {
  observability::SpanScope span("training.fit");
  span.SetAttribute("rows", static_cast<std::int64_t>(snapshot.size()));

  if (snapshot.empty()) {
    span.MarkFailed("empty training snapshot");
    throw util::EmptyTrainingSet("no historical records in table " + repository_->Schema().Table() + "; seed the store before training");
  }

  const auto started = std::chrono::steady_clock::now();
  const auto width   = projection_.Width();

  std::vector<model::FeatureRow> rows;
  rows.reserve(snapshot.size());
  for (const auto& record : snapshot) {
    rows.push_back(projection_.Project(record.features));
  }

  auto imputer = scoring::MedianImputer::Fit(rows, width);

  TrainingDiagnostics diagnostics;
  diagnostics.rows = rows.size();

  scoring::Matrix matrix;
  matrix.reserve(rows.size());
  for (const auto& row : rows) {
    matrix.push_back(imputer.Transform(row, &diagnostics.imputed_cells));
  }

  auto scaler = scoring::StandardScaler::Fit(matrix, width);
  for (auto& row : matrix) {
    scaler.Transform(row);
  }

  auto forest = scoring::IsolationForest::Fit(matrix, options_.forest);

  diagnostics.min_score = std::numeric_limits<double>::infinity();
  diagnostics.max_score = -std::numeric_limits<double>::infinity();
  for (const auto& row : matrix) {
    const double decision = forest.Decision(row);
    if (decision < 0.0) ++diagnostics.anomalies;
    diagnostics.min_score = std::min(diagnostics.min_score, decision);
    diagnostics.max_score = std::max(diagnostics.max_score, decision);
  }

  auto model = std::make_shared<const scoring::IsolationForestModel>(projection_.Names(), std::move(imputer), std::move(scaler), std::move(forest));

  const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  span.SetAttribute("anomalies", static_cast<std::int64_t>(diagnostics.anomalies));

  BRIDGEWATCH_LOG_INFO("Model trained", {observability::IntField("rows", static_cast<std::int64_t>(diagnostics.rows)),
                                         observability::IntField("features", static_cast<std::int64_t>(width)),
                                         observability::IntField("trees", static_cast<std::int64_t>(model->Forest().TreeCount())),
                                         observability::IntField("training_anomalies", static_cast<std::int64_t>(diagnostics.anomalies)),
                                         observability::DoubleField("anomaly_rate", static_cast<double>(diagnostics.anomalies) / diagnostics.rows),
                                         observability::DoubleField("min_score", diagnostics.min_score),
                                         observability::DoubleField("max_score", diagnostics.max_score),
                                         observability::IntField("imputed_cells", static_cast<std::int64_t>(diagnostics.imputed_cells)),
                                         observability::DoubleField("elapsed_ms", elapsed_ms, 1)});

  return TrainingResult{std::move(model), diagnostics};
}

} // namespace bridgewatch::training
