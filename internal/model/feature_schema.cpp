#include "internal/model/feature_schema.hpp"

#include <stdexcept>
#include <unordered_set>

namespace bridgewatch::model {

namespace {

void CheckColumnName(const std::string& kind, const std::string& name, std::unordered_set<std::string>& seen) {
  if (!FeatureSchema::IsValidIdentifier(name)) {
    throw std::invalid_argument("invalid " + kind + " name: '" + name + "'");
  }
  if (name == "id" || name == "observed_at_ms" || name == "is_anomaly" || name == "anomaly_score") {
    throw std::invalid_argument(kind + " name collides with a reserved column: '" + name + "'");
  }
  if (!seen.insert(name).second) {
    throw std::invalid_argument("duplicate " + kind + ": '" + name + "'");
  }
}

} // namespace

FeatureSchema::FeatureSchema(std::string table, std::vector<std::string> channels, std::vector<std::string> text_columns)
    : table_(std::move(table)), channels_(std::move(channels)), text_columns_(std::move(text_columns)) {
  if (!IsValidIdentifier(table_)) {
    throw std::invalid_argument("invalid table name: '" + table_ + "'");
  }
  if (channels_.empty()) {
    throw std::invalid_argument("feature schema requires at least one channel");
  }

  std::unordered_set<std::string> seen;
  for (const auto& channel : channels_) {
    CheckColumnName("channel", channel, seen);
  }
  for (const auto& column : text_columns_) {
    CheckColumnName("text column", column, seen);
  }
}

std::optional<std::size_t> FeatureSchema::IndexOf(const std::string& channel) const {
  for (std::size_t i = 0; i < channels_.size(); ++i) {
    if (channels_[i] == channel) return i;
  }
  return std::nullopt;
}

bool FeatureSchema::IsValidIdentifier(const std::string& name) {
  if (name.empty() || name.size() > 63) return false;
  const char first = name.front();
  if (!(first == '_' || (first >= 'a' && first <= 'z'))) return false;
  for (char c : name) {
    if (!(c == '_' || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'))) return false;
  }
  return true;
}

FeatureProjection::FeatureProjection(const FeatureSchema& schema, const std::vector<std::string>& features) : names_(features) {
  if (names_.empty()) {
    throw std::invalid_argument("model requires at least one feature");
  }
  indices_.reserve(names_.size());
  for (const auto& name : names_) {
    auto index = schema.IndexOf(name);
    if (!index) {
      throw std::invalid_argument("model feature '" + name + "' is not a stored channel");
    }
    indices_.push_back(*index);
  }
}

FeatureRow FeatureProjection::Project(const FeatureRow& stored) const {
  FeatureRow out;
  out.reserve(indices_.size());
  for (auto index : indices_) {
    out.push_back(index < stored.size() ? stored[index] : std::nullopt);
  }
  return out;
}

const std::vector<std::string>& DefaultChannels() {
  static const std::vector<std::string> kChannels = {
      // structural
      "strain_microstrain",
      "deflection_mm",
      "vibration_ms2",
      "tilt_deg",
      "displacement_mm",
      "crack_propagation_mm",
      "corrosion_level_percent",
      "cable_member_tension_kn",
      "bearing_joint_forces_kn",
      "fatigue_accumulation_au",
      "modal_frequency_hz",
      // environmental
      "temperature_c",
      "humidity_percent",
      "wind_speed_ms",
      "wind_direction_deg",
      "precipitation_mmh",
      "water_level_m",
      "seismic_activity_ms2",
      "solar_radiation_wm2",
      "air_quality_index_aqi",
      "soil_settlement_mm",
      // load and traffic
      "vehicle_load_tons",
      "traffic_volume_vph",
      "pedestrian_load_pph",
      "impact_events_g",
      "dynamic_load_distribution_percent",
      "axle_counts_pmin",
      // health and analysis
      "structural_health_index_shi",
      "anomaly_detection_score",
      "energy_dissipation_au",
      "acoustic_emissions_levels",
      "visual_analysis_defect_score",
      "electrical_resistance_ohms",
      "localized_strain_hotspot",
      // predictions
      "shi_predicted_24h_ahead",
      "shi_predicted_7d_ahead",
      "shi_predicted_30d_ahead",
      "probability_of_failure_pof",
      // alerts and events
      "maintenance_alert",
      "flood_event_flag",
      "simulated_water_flow_m3s",
      "soil_saturation_percent",
      "landslide_ground_movement",
      "simulated_slope_displacement_mm",
      "high_winds_storms",
      "simulated_wind_load_pressure_kpa",
      "abnormal_traffic_load_surges",
      "simulated_localized_stress_index",
      // sustainability
      "energy_harvesting_potential_w",
      "estimated_repair_cost_usd_incremental",
      "carbon_footprint_tco2e_incremental",
  };
  return kChannels;
}

const std::vector<std::string>& DefaultTextColumns() {
  static const std::vector<std::string> kColumns = {"bridge_mood_meter", "vibration_anomaly_location"};
  return kColumns;
}

const std::vector<std::string>& DefaultModelFeatures() {
  static const std::vector<std::string> kFeatures = {
      "strain_microstrain", "deflection_mm", "vibration_ms2", "tilt_deg", "displacement_mm", "cable_member_tension_kn",
  };
  return kFeatures;
}

} // namespace bridgewatch::model
