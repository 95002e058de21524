#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/telemetry_record.hpp"
#include "internal/model/feature_schema.hpp"

namespace bridgewatch::replay {

struct DatasetRow {
  // historical capture time, only when the timestamp column parsed as one
  std::optional<std::int64_t> recorded_at_ms;

  // ordered like HistoricalDataset::channels
  bridgewatch::model::FeatureRow values;

  // ordered like HistoricalDataset::text_columns
  bridgewatch::model::TextRow texts;

  // labels carried by the file; never written to the store
  std::optional<db::model::Outcome> outcome;
};

struct HistoricalDataset {
  std::vector<std::string> channels;
  std::vector<std::string> text_columns;
  std::vector<DatasetRow>  rows;

  std::size_t Size() const { return rows.size(); }
};

struct CsvOptions {
  std::string timestamp_column{"timestamp"};
};

/*
  Loads the historical bridge dataset with Arrow's CSV reader.

  Header names are matched case-insensitively against schema channels and
  text columns. Integer, floating and boolean (stored as 0/1) columns are
  accepted for channels; text columns take any type as its text. Empty cells
  and NaN/NA/null markers become absent values. Throws util::DatasetError
  when the file is unreadable, a column is missing or a channel column is
  not numeric.
*/
HistoricalDataset LoadCsvDataset(const std::string& path, const bridgewatch::model::FeatureSchema& schema, const CsvOptions& options = {});

// Index of the first replayed row: floor(total * ratio). ratio must be in [0, 1].
std::size_t SplitIndex(std::size_t total, double ratio);

} // namespace bridgewatch::replay
