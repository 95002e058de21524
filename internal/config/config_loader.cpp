#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <unordered_set>

#include "internal/model/feature_schema.hpp"
#include "internal/observability/logging.hpp"

namespace bridgewatch::config {

using bridgewatch::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // an empty document is a valid all-defaults config
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  ApplyEnvironment(config);

  try {
    Validate(config);
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error("Invalid configuration: " + std::string(e.what()));
  }

  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* database = config.mutable_database();
  if (database->table().empty()) {
    database->set_table(bridgewatch::model::kDefaultTable);
  }
  if (database->channels().empty()) {
    for (const auto& channel : bridgewatch::model::DefaultChannels()) {
      database->add_channels(channel);
    }
    if (database->text_columns().empty()) {
      for (const auto& column : bridgewatch::model::DefaultTextColumns()) {
        database->add_text_columns(column);
      }
    }
  }
  if (database->has_postgres() && database->postgres().max_connections() == 0) {
    database->mutable_postgres()->set_max_connections(4);
  }

  auto* model = config.mutable_model();
  if (model->features().empty()) {
    for (const auto& feature : bridgewatch::model::DefaultModelFeatures()) {
      model->add_features(feature);
    }
  }
  if (model->contamination() == 0.0) model->set_contamination(0.05);
  if (model->n_estimators() == 0) model->set_n_estimators(200);
  if (model->max_samples() == 0) model->set_max_samples(256);
  if (model->random_seed() == 0) model->set_random_seed(42);

  auto* scoring = config.mutable_scoring();
  if (scoring->batch_size() == 0) scoring->set_batch_size(100);
  if (!scoring->has_poll_interval_sec()) scoring->set_poll_interval_sec(2.0);
  if (scoring->idle_report_every() == 0) scoring->set_idle_report_every(10);

  auto* dataset = config.mutable_dataset();
  if (dataset->csv_path().empty()) dataset->set_csv_path("bridge_dataset.csv");
  if (!dataset->has_train_ratio()) dataset->set_train_ratio(0.70);
  if (dataset->timestamp_column().empty()) dataset->set_timestamp_column("timestamp");

  auto* replay = config.mutable_replay();
  if (!replay->has_interval_sec()) replay->set_interval_sec(1.0);

  auto* seed = config.mutable_seed();
  if (seed->chunk_size() == 0) seed->set_chunk_size(5000);

  auto* observability = config.mutable_observability();
  if (observability->service_name().empty()) observability->set_service_name("bridgewatch");
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig& config) {
  if (const char* url = std::getenv("BRIDGEWATCH_DATABASE_URL"); url && *url) {
    config.mutable_database()->mutable_postgres()->set_connection_uri(url);
    if (config.database().postgres().max_connections() == 0) {
      config.mutable_database()->mutable_postgres()->set_max_connections(4);
    }
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  // constructing the schema and projection checks identifiers and membership
  bridgewatch::model::FeatureSchema schema(config.database().table(),
                                           {config.database().channels().begin(), config.database().channels().end()},
                                           {config.database().text_columns().begin(), config.database().text_columns().end()});
  bridgewatch::model::FeatureProjection projection(schema, {config.model().features().begin(), config.model().features().end()});

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::invalid_argument("database.sqlite.path must be set");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::invalid_argument("database.postgres.connection_uri must be set");
  }

  const auto& model = config.model();
  if (!(model.contamination() > 0.0 && model.contamination() <= 0.5)) {
    throw std::invalid_argument("model.contamination must be in (0, 0.5]");
  }

  const auto& scoring = config.scoring();
  if (!std::isfinite(scoring.poll_interval_sec()) || scoring.poll_interval_sec() < 0.0) {
    throw std::invalid_argument("scoring.poll_interval_sec must be >= 0");
  }

  const auto& dataset = config.dataset();
  if (!(dataset.train_ratio() >= 0.0 && dataset.train_ratio() <= 1.0)) {
    throw std::invalid_argument("dataset.train_ratio must be in [0, 1]");
  }

  if (!std::isfinite(config.replay().interval_sec()) || config.replay().interval_sec() < 0.0) {
    throw std::invalid_argument("replay.interval_sec must be >= 0");
  }

  if (!config.logging().level().empty()) {
    (void)bridgewatch::observability::ParseLevel(config.logging().level());
  }
}

} // namespace bridgewatch::config
