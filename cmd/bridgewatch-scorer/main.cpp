#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/cancellation.hpp"
#include "internal/runtime/scoring_loop.hpp"
#include "internal/runtime/signals.hpp"
#include "internal/training/training_coordinator.hpp"
#include "internal/util/flags.hpp"

using bridgewatch::observability::DoubleField;
using bridgewatch::observability::IntField;
using bridgewatch::observability::StringField;

namespace {

void Usage() {
  std::cerr << "Usage: bridgewatch-scorer --config <config.yaml> [--batch-size N] [--poll-interval SEC]" << std::endl;
}

void Shutdown() {
  bridgewatch::observability::ShutdownLogging();
  bridgewatch::observability::ShutdownMetrics();
  bridgewatch::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  std::optional<uint32_t> batch_size;
  std::optional<double>   poll_interval;

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--config" && i + 1 < argc) {
        config_path = argv[++i];
      } else if (arg == "--batch-size" && i + 1 < argc) {
        batch_size = static_cast<uint32_t>(
            bridgewatch::util::ParseCountFlag("--batch-size", argv[++i], 1, std::numeric_limits<uint32_t>::max()));
      } else if (arg == "--poll-interval" && i + 1 < argc) {
        poll_interval = bridgewatch::util::ParseSecondsFlag("--poll-interval", argv[++i]);
      } else {
        throw std::invalid_argument("unexpected argument: " + arg);
      }
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    Usage();
    return 1;
  }
  if (config_path.empty()) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = bridgewatch::config::ConfigLoader::LoadFromYaml(config_path);
    if (batch_size) config.mutable_scoring()->set_batch_size(*batch_size);
    if (poll_interval) config.mutable_scoring()->set_poll_interval_sec(*poll_interval);

    bridgewatch::observability::InitializeTracing(config);
    bridgewatch::observability::InitializeMetrics(config);
    bridgewatch::observability::InitializeLogging(config, "bridgewatch-scorer");

    // ------------------------------------------------------------
    // Connect and train
    // ------------------------------------------------------------
    auto repository = bridgewatch::factory::BuildRepository(config);

    auto options = bridgewatch::training::TrainingOptions::FromConfig(config);
    auto trained = bridgewatch::training::TrainingCoordinator(repository, options).TrainFromStore();

    // ------------------------------------------------------------
    // Score until SIGINT / SIGTERM
    // ------------------------------------------------------------
    bridgewatch::runtime::CancellationToken token;
    bridgewatch::runtime::InstallStopSignalHandlers(token);

    bridgewatch::runtime::ScoringLoop loop(repository, trained.model,
                                           bridgewatch::model::FeatureProjection(repository->Schema(), options.features),
                                           bridgewatch::runtime::ScoringLoopOptions::FromConfig(config), token);

    BRIDGEWATCH_LOG_INFO("Scorer started", {StringField("table", repository->Schema().Table()),
                                            IntField("training_rows", static_cast<int64_t>(trained.diagnostics.rows)),
                                            DoubleField("poll_interval_sec", config.scoring().poll_interval_sec(), 2)});

    loop.Run();
    Shutdown();
  } catch (const std::exception& e) {
    BRIDGEWATCH_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  return 0;
}
