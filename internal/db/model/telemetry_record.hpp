#pragma once

#include <cstdint>
#include <optional>

#include "internal/model/feature_schema.hpp"

namespace bridgewatch::db::model {

using FeatureRow = bridgewatch::model::FeatureRow;
using TextRow    = bridgewatch::model::TextRow;

struct Outcome {
  bool   is_anomaly    = false;
  double anomaly_score = 0.0;
};

/*
  Persistent telemetry row.

  IMPORTANT:
  - id is assigned by the store on insert and is the only ordering key.
  - features follows the column order of the repository's FeatureSchema.
  - texts follows its text columns; an empty vector stores every one as NULL.
  - outcome is absent while the record is pending and is written once.
*/

struct TelemetryRecord {
  int64_t id = 0;

  // unix milliseconds
  int64_t observed_at_ms = 0;

  FeatureRow features;

  TextRow texts;

  std::optional<Outcome> outcome;

  bool IsPending() const {
    return !outcome.has_value();
  }
};

struct OutcomeUpdate {
  int64_t id            = 0;
  bool    is_anomaly    = false;
  double  anomaly_score = 0.0;
};

} // namespace bridgewatch::db::model
