#pragma once

#include <cstddef>
#include <vector>

#include "internal/model/feature_schema.hpp"

namespace bridgewatch::scoring {

struct Verdict {
  bool   is_anomaly = false;
  // raw decision value, lower is more anomalous
  double score = 0.0;
};

/*
  Fitted anomaly model.

  ScoreBatch is order-preserving: verdict i belongs to row i. It is a pure
  function of the fitted state, so one instance can be shared read-only by
  any number of callers. A row whose width differs from FeatureCount()
  throws std::invalid_argument.
*/
class ScoringModel {
 public:
  virtual ~ScoringModel() = default;

  virtual std::vector<Verdict> ScoreBatch(const std::vector<bridgewatch::model::FeatureRow>& rows) const = 0;

  virtual std::size_t FeatureCount() const = 0;
};

} // namespace bridgewatch::scoring
