#pragma once

#include <string>
#include <vector>

#include "isolation_forest.hpp"
#include "preprocessing.hpp"
#include "scoring_model.hpp"

namespace bridgewatch::scoring {

/*
  ScoringModel bundling the fitted imputer, scaler and isolation forest.
  Rows are imputed, standardized and then scored by the forest's decision
  function; label is decision < 0.
*/
class IsolationForestModel final : public ScoringModel {
 public:
  IsolationForestModel(std::vector<std::string> features, MedianImputer imputer, StandardScaler scaler, IsolationForest forest);

  std::vector<Verdict> ScoreBatch(const std::vector<bridgewatch::model::FeatureRow>& rows) const override;

  std::size_t FeatureCount() const override { return features_.size(); }

  const std::vector<std::string>& FeatureNames() const { return features_; }
  const MedianImputer&            Imputer() const { return imputer_; }
  const StandardScaler&           Scaler() const { return scaler_; }
  const IsolationForest&          Forest() const { return forest_; }

  // imputed + standardized input to the forest
  std::vector<double> Prepare(const bridgewatch::model::FeatureRow& row, std::size_t* imputed = nullptr) const;

 private:
  std::vector<std::string> features_;
  MedianImputer            imputer_;
  StandardScaler           scaler_;
  IsolationForest          forest_;
};

} // namespace bridgewatch::scoring
