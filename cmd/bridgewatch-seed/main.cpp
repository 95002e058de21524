#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/replay/csv_dataset.hpp"
#include "internal/replay/seeder.hpp"

using bridgewatch::observability::StringField;

namespace {

void Shutdown() {
  bridgewatch::observability::ShutdownLogging();
  bridgewatch::observability::ShutdownMetrics();
  bridgewatch::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool        truncate = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--truncate") {
      truncate = true;
    } else {
      config_path.clear();
      break;
    }
  }
  if (config_path.empty()) {
    std::cerr << "Usage: bridgewatch-seed --config <config.yaml> [--truncate]" << std::endl;
    return 1;
  }

  try {
    auto config = bridgewatch::config::ConfigLoader::LoadFromYaml(config_path);

    bridgewatch::observability::InitializeTracing(config);
    bridgewatch::observability::InitializeMetrics(config);
    bridgewatch::observability::InitializeLogging(config, "bridgewatch-seed");

    auto options = bridgewatch::replay::SeedOptions::FromConfig(config);
    if (truncate) options.truncate_existing = true;

    auto dataset = bridgewatch::replay::LoadCsvDataset(config.dataset().csv_path(), bridgewatch::factory::BuildSchema(config),
                                                       {config.dataset().timestamp_column()});
    auto repository = bridgewatch::factory::BuildRepository(config);

    bridgewatch::replay::Seeder seeder(repository, dataset, config.dataset().train_ratio(), options);
    seeder.Run();

    repository->ConnectionHandle().Close();
    Shutdown();
  } catch (const std::exception& e) {
    BRIDGEWATCH_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  return 0;
}
