#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/model/feature_schema.hpp"

namespace bridgewatch::db::sql {

/*
  SQL for the telemetry table, generated from a FeatureSchema.

  Parameter markers differ per backend:
    Postgres: $1 $2 $3
    SQLite:   ? ? ?

  Every SELECT returns columns in the same order:
    id, observed_at_ms, <channels...>, <text columns...>, is_anomaly, anomaly_score
*/

enum class Dialect { kSqlite, kPostgres };

class TelemetryStatements {
 public:
  TelemetryStatements(const bridgewatch::model::FeatureSchema& schema, Dialect dialect);

  // CREATE TABLE / CREATE INDEX, all IF NOT EXISTS
  const std::vector<std::string>& Bootstrap() const { return bootstrap_; }

  // Selects every configured column without returning rows. Fails on a
  // table created before a channel or text column was configured.
  const std::string& VerifyColumns() const { return verify_columns_; }

  // params: observed_at_ms, channels..., text columns...  (Postgres variant RETURNING id)
  const std::string& Insert() const { return insert_; }

  // params: id
  const std::string& SelectById() const { return select_by_id_; }

  const std::string& SelectAll() const { return select_all_; }

  // params: limit
  const std::string& SelectPending() const { return select_pending_; }

  // params: is_anomaly, anomaly_score, id
  const std::string& UpdateOutcome() const { return update_outcome_; }

  const std::string& CountTotal() const { return count_total_; }
  const std::string& CountPending() const { return count_pending_; }
  const std::string& CountAnomalies() const { return count_anomalies_; }

  const std::vector<std::string>& Truncate() const { return truncate_; }

  // column index helpers for result rows
  static constexpr int kIdColumn         = 0;
  static constexpr int kObservedAtColumn = 1;
  static constexpr int kFirstChannelColumn = 2;
  int FirstTextColumn() const { return kFirstChannelColumn + static_cast<int>(width_); }
  int IsAnomalyColumn() const { return FirstTextColumn() + static_cast<int>(text_width_); }
  int ScoreColumn() const { return IsAnomalyColumn() + 1; }

 private:
  std::string Marker(int n) const;

  Dialect     dialect_;
  std::size_t width_;
  std::size_t text_width_;

  std::vector<std::string> bootstrap_;
  std::string              verify_columns_;
  std::string              insert_;
  std::string              select_by_id_;
  std::string              select_all_;
  std::string              select_pending_;
  std::string              update_outcome_;
  std::string              count_total_;
  std::string              count_pending_;
  std::string              count_anomalies_;
  std::vector<std::string> truncate_;
};

} // namespace bridgewatch::db::sql
