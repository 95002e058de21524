#include "isolation_forest_model.hpp"

#include <stdexcept>

namespace bridgewatch::scoring {

IsolationForestModel::IsolationForestModel(std::vector<std::string> features, MedianImputer imputer, StandardScaler scaler, IsolationForest forest)
    : features_(std::move(features)), imputer_(std::move(imputer)), scaler_(std::move(scaler)), forest_(std::move(forest)) {
  if (imputer_.Medians().size() != features_.size() || scaler_.Means().size() != features_.size() || forest_.FeatureCount() != features_.size()) {
    throw std::invalid_argument("imputer, scaler and forest must be fitted on the same features");
  }
}

std::vector<double> IsolationForestModel::Prepare(const bridgewatch::model::FeatureRow& row, std::size_t* imputed) const {
  auto values = imputer_.Transform(row, imputed);
  scaler_.Transform(values);
  return values;
}

std::vector<Verdict> IsolationForestModel::ScoreBatch(const std::vector<bridgewatch::model::FeatureRow>& rows) const {
  std::vector<Verdict> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    const double decision = forest_.Decision(Prepare(row));
    out.push_back(Verdict{decision < 0.0, decision});
  }
  return out;
}

} // namespace bridgewatch::scoring
