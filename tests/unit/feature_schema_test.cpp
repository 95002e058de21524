#include "internal/model/feature_schema.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using bridgewatch::model::FeatureProjection;
using bridgewatch::model::FeatureRow;
using bridgewatch::model::FeatureSchema;

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestIdentifierRules() {
  assert(FeatureSchema::IsValidIdentifier("strain_microstrain"));
  assert(FeatureSchema::IsValidIdentifier("_tmp2"));
  assert(!FeatureSchema::IsValidIdentifier(""));
  assert(!FeatureSchema::IsValidIdentifier("2fast"));
  assert(!FeatureSchema::IsValidIdentifier("Strain"));
  assert(!FeatureSchema::IsValidIdentifier("tilt deg"));
  assert(!FeatureSchema::IsValidIdentifier("x;drop"));
  assert(!FeatureSchema::IsValidIdentifier(std::string(64, 'a')));
}

void TestSchemaRejectsBadChannels() {
  assert(ThrowsInvalidArgument([] { FeatureSchema("bridge", {}); }));
  assert(ThrowsInvalidArgument([] { FeatureSchema("bridge", {"tilt_deg", "tilt_deg"}); }));
  assert(ThrowsInvalidArgument([] { FeatureSchema("bridge", {"tilt_deg", "is_anomaly"}); }));
  assert(ThrowsInvalidArgument([] { FeatureSchema("bridge", {"id"}); }));
  assert(ThrowsInvalidArgument([] { FeatureSchema("Bridge", {"tilt_deg"}); }));
}

void TestTextColumnsAreKeptApart() {
  FeatureSchema schema("bridge", {"strain_microstrain", "tilt_deg"}, {"bridge_mood_meter"});
  assert(schema.Width() == 2);
  assert(schema.TextWidth() == 1);
  assert(!schema.IndexOf("bridge_mood_meter").has_value());
  assert(ThrowsInvalidArgument([&] { (void)FeatureProjection(schema, {"bridge_mood_meter"}); }));

  assert(ThrowsInvalidArgument([] { FeatureSchema("bridge", {"tilt_deg"}, {"tilt_deg"}); }));
  assert(ThrowsInvalidArgument([] { FeatureSchema("bridge", {"tilt_deg"}, {"anomaly_score"}); }));
  assert(ThrowsInvalidArgument([] { FeatureSchema("bridge", {"tilt_deg"}, {"Mood"}); }));
}

void TestIndexOf() {
  FeatureSchema schema("bridge", {"strain_microstrain", "tilt_deg", "wind_speed_ms"});
  assert(schema.Width() == 3);
  assert(schema.IndexOf("tilt_deg") == 1u);
  assert(!schema.IndexOf("deflection_mm").has_value());
}

void TestProjectionFollowsFeatureOrder() {
  FeatureSchema     schema("bridge", {"strain_microstrain", "tilt_deg", "wind_speed_ms"});
  FeatureProjection projection(schema, {"wind_speed_ms", "strain_microstrain"});
  assert(projection.Width() == 2);

  FeatureRow stored = {1.0, std::nullopt, 3.0};
  auto       row    = projection.Project(stored);
  assert(row.size() == 2);
  assert(row[0] == 3.0);
  assert(row[1] == 1.0);

  // a short stored row projects missing values instead of reading past it
  auto short_row = projection.Project(FeatureRow{5.0});
  assert(!short_row[0].has_value());
  assert(short_row[1] == 5.0);
}

void TestProjectionRejectsUnknownFeature() {
  FeatureSchema schema("bridge", {"strain_microstrain"});
  assert(ThrowsInvalidArgument([&] { FeatureProjection(schema, {"tilt_deg"}); }));
  assert(ThrowsInvalidArgument([&] { FeatureProjection(schema, {}); }));
}

void TestDefaults() {
  const auto& channels = bridgewatch::model::DefaultChannels();
  FeatureSchema schema(bridgewatch::model::kDefaultTable, channels, bridgewatch::model::DefaultTextColumns());
  for (const auto& feature : bridgewatch::model::DefaultModelFeatures()) {
    assert(schema.IndexOf(feature).has_value());
  }
  assert(bridgewatch::model::DefaultModelFeatures().size() == 6);
  assert(schema.TextWidth() == 2);
}

} // namespace

int main() {
  TestIdentifierRules();
  TestSchemaRejectsBadChannels();
  TestTextColumnsAreKeptApart();
  TestIndexOf();
  TestProjectionFollowsFeatureOrder();
  TestProjectionRejectsUnknownFeature();
  TestDefaults();

  std::cout << "bridgewatch_unit_feature_schema: pass\n";
  return 0;
}
