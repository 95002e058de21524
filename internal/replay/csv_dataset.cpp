#include "internal/replay/csv_dataset.hpp"

#include <arrow/api.h>
#include <arrow/csv/api.h>
#include <arrow/io/file.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace bridgewatch::replay {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kAnomalyColumn = "is_anomaly";
constexpr const char* kScoreColumn   = "anomaly_score";

template <typename T>
T Unwrap(arrow::Result<T> result, const std::string& context) {
  if (!result.ok()) throw util::DatasetError(context + ": " + result.status().ToString());
  return std::move(result).ValueUnsafe();
}

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::shared_ptr<arrow::Table> ReadTable(const std::string& path) {
  auto input = Unwrap(arrow::io::ReadableFile::Open(path), "open " + path);

  auto read_options    = arrow::csv::ReadOptions::Defaults();
  auto parse_options   = arrow::csv::ParseOptions::Defaults();
  auto convert_options = arrow::csv::ConvertOptions::Defaults();
  convert_options.null_values         = {"", "NA", "N/A", "NaN", "nan", "null", "NULL", "None"};
  convert_options.strings_can_be_null = true;

  auto reader = Unwrap(arrow::csv::TableReader::Make(arrow::io::default_io_context(), input, read_options, parse_options, convert_options),
                       "csv reader for " + path);
  return Unwrap(reader->Read(), "read " + path);
}

// Walks every cell of a chunked column, handing fn(row, value-or-nullopt).
template <typename ArrayType, typename Fn>
void ForEachCell(const arrow::ChunkedArray& column, Fn&& fn) {
  std::size_t row = 0;
  for (const auto& chunk : column.chunks()) {
    const auto& typed = static_cast<const ArrayType&>(*chunk);
    for (int64_t i = 0; i < typed.length(); ++i, ++row) {
      if (typed.IsNull(i)) {
        fn(row, std::nullopt);
      } else {
        fn(row, std::optional(typed.Value(i)));
      }
    }
  }
}

// Fills out[row] for every row with the column's numeric value, or nullopt.
// Returns false for non-numeric column types.
bool ReadNumeric(const arrow::ChunkedArray& column, std::vector<std::optional<double>>& out) {
  switch (column.type()->id()) {
    case arrow::Type::DOUBLE:
      ForEachCell<arrow::DoubleArray>(column, [&](std::size_t row, std::optional<double> v) {
        out[row] = (v && std::isfinite(*v)) ? v : std::nullopt;
      });
      return true;
    case arrow::Type::INT64:
      ForEachCell<arrow::Int64Array>(column, [&](std::size_t row, std::optional<int64_t> v) {
        if (v) out[row] = static_cast<double>(*v);
      });
      return true;
    case arrow::Type::BOOL:
      ForEachCell<arrow::BooleanArray>(column, [&](std::size_t row, std::optional<bool> v) {
        if (v) out[row] = *v ? 1.0 : 0.0;
      });
      return true;
    case arrow::Type::NA:
      return true;
    default:
      return false;
  }
}

// Fills out[row] with the cell's text. Non-string columns are rendered the
// way Arrow prints their scalars.
void ReadText(const arrow::ChunkedArray& column, const std::string& context, std::vector<std::optional<std::string>>& out) {
  const bool  is_string = column.type()->id() == arrow::Type::STRING;
  std::size_t row       = 0;
  for (const auto& chunk : column.chunks()) {
    for (int64_t i = 0; i < chunk->length(); ++i, ++row) {
      if (chunk->IsNull(i)) continue;
      if (is_string) {
        out[row] = static_cast<const arrow::StringArray&>(*chunk).GetString(i);
      } else {
        out[row] = Unwrap(chunk->GetScalar(i), context)->ToString();
      }
    }
  }
}

int64_t TimestampToMillis(int64_t value, arrow::TimeUnit::type unit) {
  switch (unit) {
    case arrow::TimeUnit::SECOND:
      return value * 1000;
    case arrow::TimeUnit::MILLI:
      return value;
    case arrow::TimeUnit::MICRO:
      return value / 1000;
    case arrow::TimeUnit::NANO:
      return value / 1000000;
  }
  return value;
}

} // namespace

HistoricalDataset LoadCsvDataset(const std::string& path, const bridgewatch::model::FeatureSchema& schema, const CsvOptions& options) {
  auto table = ReadTable(path);

  std::unordered_map<std::string, int> by_name;
  for (int i = 0; i < table->num_columns(); ++i) {
    by_name.emplace(Lower(table->schema()->field(i)->name()), i);
  }

  const auto rows  = static_cast<std::size_t>(table->num_rows());
  const auto width = schema.Width();

  HistoricalDataset dataset;
  dataset.channels     = schema.Channels();
  dataset.text_columns = schema.TextColumns();
  dataset.rows.resize(rows);
  for (auto& row : dataset.rows) {
    row.values.assign(width, std::nullopt);
    row.texts.assign(schema.TextWidth(), std::nullopt);
  }

  std::vector<std::optional<double>> cells(rows);
  for (std::size_t c = 0; c < width; ++c) {
    const auto& channel = schema.Channels()[c];
    auto        it      = by_name.find(channel);
    if (it == by_name.end()) {
      throw util::DatasetError("dataset " + path + " has no column for channel '" + channel + "'");
    }
    const auto& column = *table->column(it->second);

    std::fill(cells.begin(), cells.end(), std::nullopt);
    if (!ReadNumeric(column, cells)) {
      throw util::DatasetError("column '" + channel + "' in " + path + " is not numeric (" + column.type()->ToString() + ")");
    }
    for (std::size_t r = 0; r < rows; ++r) {
      dataset.rows[r].values[c] = cells[r];
    }
  }

  std::vector<std::optional<std::string>> texts(rows);
  for (std::size_t c = 0; c < schema.TextWidth(); ++c) {
    const auto& name = schema.TextColumns()[c];
    auto        it   = by_name.find(name);
    if (it == by_name.end()) {
      throw util::DatasetError("dataset " + path + " has no column for text column '" + name + "'");
    }

    std::fill(texts.begin(), texts.end(), std::nullopt);
    ReadText(*table->column(it->second), "column '" + name + "' in " + path, texts);
    for (std::size_t r = 0; r < rows; ++r) {
      dataset.rows[r].texts[c] = std::move(texts[r]);
    }
  }

  bool with_timestamps = false;
  if (auto it = by_name.find(Lower(options.timestamp_column)); it != by_name.end()) {
    const auto& column = *table->column(it->second);
    if (column.type()->id() == arrow::Type::TIMESTAMP) {
      const auto unit = static_cast<const arrow::TimestampType&>(*column.type()).unit();
      ForEachCell<arrow::TimestampArray>(column, [&](std::size_t row, std::optional<int64_t> v) {
        if (v) dataset.rows[row].recorded_at_ms = TimestampToMillis(*v, unit);
      });
      with_timestamps = true;
    } else {
      BRIDGEWATCH_LOG_WARN("Timestamp column is not a timestamp, ignoring it",
                           {StringField("column", options.timestamp_column), StringField("type", column.type()->ToString())});
    }
  }

  // Labels from an earlier run. Read so callers can drop them explicitly.
  std::vector<std::optional<bool>> labels(rows);
  if (auto it = by_name.find(kAnomalyColumn); it != by_name.end()) {
    const auto& column = *table->column(it->second);
    if (column.type()->id() == arrow::Type::BOOL) {
      ForEachCell<arrow::BooleanArray>(column, [&](std::size_t row, std::optional<bool> v) { labels[row] = v; });
    } else if (column.type()->id() == arrow::Type::INT64) {
      ForEachCell<arrow::Int64Array>(column, [&](std::size_t row, std::optional<int64_t> v) {
        if (v) labels[row] = *v != 0;
      });
    }
  }
  std::fill(cells.begin(), cells.end(), std::nullopt);
  if (auto it = by_name.find(kScoreColumn); it != by_name.end()) {
    ReadNumeric(*table->column(it->second), cells);
  }
  for (std::size_t r = 0; r < rows; ++r) {
    if (labels[r]) {
      dataset.rows[r].outcome = db::model::Outcome{*labels[r], cells[r].value_or(0.0)};
    }
  }

  BRIDGEWATCH_LOG_INFO("Dataset loaded", {StringField("path", path), IntField("rows", static_cast<int64_t>(rows)),
                                          IntField("channels", static_cast<int64_t>(width)),
                                          IntField("text_columns", static_cast<int64_t>(schema.TextWidth())),
                                          StringField("timestamps", with_timestamps ? "historical" : "none")});
  return dataset;
}

std::size_t SplitIndex(std::size_t total, double ratio) {
  if (!(ratio >= 0.0 && ratio <= 1.0)) {
    throw std::invalid_argument("split ratio must be within [0, 1]");
  }
  auto split = static_cast<std::size_t>(std::floor(static_cast<double>(total) * ratio));
  return std::min(split, total);
}

} // namespace bridgewatch::replay
