#include "telemetry_sql.hpp"

namespace bridgewatch::db::sql {

TelemetryStatements::TelemetryStatements(const bridgewatch::model::FeatureSchema& schema, Dialect dialect)
    : dialect_(dialect), width_(schema.Width()), text_width_(schema.TextWidth()) {
  const auto& table = schema.Table();
  const bool  pg    = dialect_ == Dialect::kPostgres;

  std::string column_list;
  std::string column_ddl;
  for (const auto& channel : schema.Channels()) {
    column_list += "," + channel;
    column_ddl += ", " + channel + (pg ? " DOUBLE PRECISION" : " REAL");
  }
  for (const auto& column : schema.TextColumns()) {
    column_list += "," + column;
    column_ddl += ", " + column + " TEXT";
  }

  const std::string id_ddl = pg ? "id BIGSERIAL PRIMARY KEY" : "id INTEGER PRIMARY KEY AUTOINCREMENT";
  bootstrap_.push_back("CREATE TABLE IF NOT EXISTS " + table + " (" + id_ddl + ", observed_at_ms BIGINT NOT NULL" + column_ddl +
                       ", is_anomaly BOOLEAN, anomaly_score " + (pg ? "DOUBLE PRECISION" : "REAL") + ");");
  bootstrap_.push_back("CREATE INDEX IF NOT EXISTS idx_" + table + "_pending ON " + table + "(id) WHERE is_anomaly IS NULL;");
  bootstrap_.push_back("CREATE INDEX IF NOT EXISTS idx_" + table + "_observed_at ON " + table + "(observed_at_ms);");

  std::string values = Marker(1);
  for (std::size_t i = 0; i < width_ + text_width_; ++i) {
    values += "," + Marker(static_cast<int>(i) + 2);
  }
  insert_ = "INSERT INTO " + table + "(observed_at_ms" + column_list + ") VALUES(" + values + ")" + (pg ? " RETURNING id" : "") + ";";

  const std::string select = "SELECT id,observed_at_ms" + column_list + ",is_anomaly,anomaly_score FROM " + table;
  verify_columns_ = select + " LIMIT 0;";
  select_by_id_   = select + " WHERE id=" + Marker(1) + ";";
  select_all_     = select + " ORDER BY id ASC;";
  select_pending_ = select + " WHERE is_anomaly IS NULL ORDER BY id ASC LIMIT " + Marker(1) + ";";

  // conditional on the row still being pending so an outcome is never rewritten
  update_outcome_ = "UPDATE " + table + " SET is_anomaly=" + Marker(1) + ",anomaly_score=" + Marker(2) + " WHERE id=" + Marker(3) +
                    " AND is_anomaly IS NULL;";

  count_total_     = "SELECT COUNT(*) FROM " + table + ";";
  count_pending_   = "SELECT COUNT(*) FROM " + table + " WHERE is_anomaly IS NULL;";
  count_anomalies_ = "SELECT COUNT(*) FROM " + table + " WHERE is_anomaly = " + (pg ? "TRUE" : "1") + ";";

  if (pg) {
    truncate_.push_back("TRUNCATE TABLE " + table + " RESTART IDENTITY;");
  } else {
    truncate_.push_back("DELETE FROM " + table + ";");
    truncate_.push_back("DELETE FROM sqlite_sequence WHERE name='" + table + "';");
  }
}

std::string TelemetryStatements::Marker(int n) const {
  if (dialect_ == Dialect::kPostgres) {
    return "$" + std::to_string(n);
  }
  return "?";
}

} // namespace bridgewatch::db::sql
