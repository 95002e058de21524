#include "internal/replay/csv_dataset.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using bridgewatch::model::FeatureSchema;
using bridgewatch::replay::CsvOptions;
using bridgewatch::replay::LoadCsvDataset;
using bridgewatch::replay::SplitIndex;

std::filesystem::path WriteCsv(const std::string& test_name, const std::string& content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "bridgewatch_csv_dataset_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".csv");
  std::ofstream out(file_path);
  out << content;
  out.close();

  return file_path;
}

const char* kBridgeCsv = R"(Timestamp,Strain_Microstrain,Vibration_ms2,Temperature_C,Bridge_Mood_Meter,is_anomaly,anomaly_score
2024-01-01 00:00:00,100.5,0.2,21,calm,0,0.1
2024-01-01 00:05:00,,0.3,22,calm,1,-0.2
2024-01-01 00:10:00,102,NaN,23,grumpy,,
)";

FeatureSchema Schema() {
  return FeatureSchema("bridge_telemetry", {"strain_microstrain", "vibration_ms2", "temperature_c"});
}

bool ThrowsDatasetError(const std::string& path, const FeatureSchema& schema) {
  try {
    (void)LoadCsvDataset(path, schema);
  } catch (const bridgewatch::util::DatasetError&) {
    return true;
  }
  return false;
}

void TestLoadsChannelsCaseInsensitively() {
  const auto path    = WriteCsv("bridge", kBridgeCsv);
  auto       dataset = LoadCsvDataset(path.string(), Schema());

  assert(dataset.Size() == 3);
  assert(dataset.channels.size() == 3);

  const auto& first = dataset.rows[0].values;
  assert(first[0] == 100.5);
  assert(first[1] == 0.2);
  // integer column widened to double
  assert(first[2] == 21.0);

  // empty cell and NaN marker are absent
  assert(!dataset.rows[1].values[0].has_value());
  assert(!dataset.rows[2].values[1].has_value());
  assert(dataset.rows[2].values[0] == 102.0);
}

void TestReadsTimestampsAndLabels() {
  const auto path    = WriteCsv("labels", kBridgeCsv);
  auto       dataset = LoadCsvDataset(path.string(), Schema());

  // 2024-01-01T00:00:00Z
  assert(dataset.rows[0].recorded_at_ms == 1704067200000LL);
  assert(dataset.rows[1].recorded_at_ms == 1704067500000LL);

  assert(dataset.rows[0].outcome.has_value());
  assert(!dataset.rows[0].outcome->is_anomaly);
  assert(dataset.rows[0].outcome->anomaly_score == 0.1);
  assert(dataset.rows[1].outcome->is_anomaly);
  assert(!dataset.rows[2].outcome.has_value());
}

void TestUnparsedTimestampIsIgnored() {
  const auto path = WriteCsv("text_timestamp", R"(timestamp,strain_microstrain,vibration_ms2,temperature_c
yesterday,1,2,3
today,4,5,6
)");
  auto       dataset = LoadCsvDataset(path.string(), Schema());
  assert(dataset.Size() == 2);
  assert(!dataset.rows[0].recorded_at_ms.has_value());
  assert(dataset.rows[1].values[2] == 6.0);
}

void TestCustomTimestampColumn() {
  const auto path = WriteCsv("custom_timestamp", R"(captured,strain_microstrain,vibration_ms2,temperature_c
2024-01-01 00:00:01,1,2,3
)");
  auto       dataset = LoadCsvDataset(path.string(), Schema(), CsvOptions{"Captured"});
  assert(dataset.rows[0].recorded_at_ms == 1704067201000LL);
}

void TestMissingChannelIsFatal() {
  const auto path = WriteCsv("missing", R"(strain_microstrain,vibration_ms2
1,2
)");
  assert(ThrowsDatasetError(path.string(), Schema()));
}

void TestTextChannelIsFatal() {
  const auto path = WriteCsv("text_channel", kBridgeCsv);
  assert(ThrowsDatasetError(path.string(), FeatureSchema("bridge_telemetry", {"strain_microstrain", "bridge_mood_meter"})));
}

void TestTextColumnsPassThrough() {
  const auto path = WriteCsv("text_columns", kBridgeCsv);
  auto       dataset =
      LoadCsvDataset(path.string(), FeatureSchema("bridge_telemetry", {"strain_microstrain", "vibration_ms2", "temperature_c"}, {"bridge_mood_meter"}));

  assert(dataset.text_columns.size() == 1);
  assert(dataset.rows[0].texts.size() == 1);
  assert(dataset.rows[0].texts[0] == std::string("calm"));
  assert(dataset.rows[2].texts[0] == std::string("grumpy"));
  // numeric channels are unaffected
  assert(dataset.rows[0].values[0] == 100.5);
}

void TestNonStringTextColumnKeepsItsText() {
  const auto path = WriteCsv("numeric_text", R"(strain_microstrain,vibration_ms2,temperature_c,vibration_anomaly_location
1,2,3,7
4,5,6,
)");
  auto       dataset =
      LoadCsvDataset(path.string(), FeatureSchema("bridge_telemetry", {"strain_microstrain", "vibration_ms2", "temperature_c"}, {"vibration_anomaly_location"}));
  assert(dataset.rows[0].texts[0] == std::string("7"));
  assert(!dataset.rows[1].texts[0].has_value());
}

void TestMissingTextColumnIsFatal() {
  const auto path = WriteCsv("missing_text", R"(strain_microstrain,vibration_ms2,temperature_c
1,2,3
)");
  assert(ThrowsDatasetError(path.string(),
                            FeatureSchema("bridge_telemetry", {"strain_microstrain", "vibration_ms2", "temperature_c"}, {"bridge_mood_meter"})));
}

void TestBooleanChannelIsStoredAsZeroOrOne() {
  const auto path = WriteCsv("boolean_channel", R"(strain_microstrain,maintenance_alert
1.5,true
2.5,false
3.5,
)");
  auto       dataset = LoadCsvDataset(path.string(), FeatureSchema("bridge_telemetry", {"strain_microstrain", "maintenance_alert"}));
  assert(dataset.rows[0].values[1] == 1.0);
  assert(dataset.rows[1].values[1] == 0.0);
  assert(!dataset.rows[2].values[1].has_value());
}

void TestMissingFileIsFatal() {
  assert(ThrowsDatasetError("/nonexistent/bridge_dataset.csv", Schema()));
}

void TestSplitIndex() {
  assert(SplitIndex(10, 0.7) == 7);
  assert(SplitIndex(17, 0.7) == 11);
  assert(SplitIndex(0, 0.7) == 0);
  assert(SplitIndex(5, 0.0) == 0);
  assert(SplitIndex(5, 1.0) == 5);

  bool threw = false;
  try {
    (void)SplitIndex(5, 1.5);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestLoadsChannelsCaseInsensitively();
  TestReadsTimestampsAndLabels();
  TestUnparsedTimestampIsIgnored();
  TestCustomTimestampColumn();
  TestMissingChannelIsFatal();
  TestTextChannelIsFatal();
  TestTextColumnsPassThrough();
  TestNonStringTextColumnKeepsItsText();
  TestMissingTextColumnIsFatal();
  TestBooleanChannelIsStoredAsZeroOrOne();
  TestMissingFileIsFatal();
  TestSplitIndex();

  std::cout << "bridgewatch_unit_csv_dataset: pass\n";
  return 0;
}
