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
#include "internal/replay/csv_dataset.hpp"
#include "internal/replay/feed_producer.hpp"
#include "internal/runtime/cancellation.hpp"
#include "internal/runtime/signals.hpp"
#include "internal/util/flags.hpp"

using bridgewatch::observability::StringField;

namespace {

void Usage() {
  std::cerr << "Usage: bridgewatch-replay --config <config.yaml> [--count N] [--speed SEC]\n"
            << "  --count N    records to replay, 0 for all held-back rows\n"
            << "  --speed SEC  delay between insertions" << std::endl;
}

void Shutdown() {
  bridgewatch::observability::ShutdownLogging();
  bridgewatch::observability::ShutdownMetrics();
  bridgewatch::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  std::optional<std::uint64_t> count;
  std::optional<double>        speed;

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--config" && i + 1 < argc) {
        config_path = argv[++i];
      } else if (arg == "--count" && i + 1 < argc) {
        count = bridgewatch::util::ParseCountFlag("--count", argv[++i], 0, std::numeric_limits<std::uint64_t>::max());
      } else if (arg == "--speed" && i + 1 < argc) {
        speed = bridgewatch::util::ParseSecondsFlag("--speed", argv[++i]);
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
    auto config = bridgewatch::config::ConfigLoader::LoadFromYaml(config_path);

    bridgewatch::observability::InitializeTracing(config);
    bridgewatch::observability::InitializeMetrics(config);
    bridgewatch::observability::InitializeLogging(config, "bridgewatch-replay");

    auto options = bridgewatch::replay::ReplayOptions::FromConfig(config);
    if (count) options.max_count = static_cast<std::size_t>(*count);
    if (speed) options.interval_sec = *speed;

    auto dataset = bridgewatch::replay::LoadCsvDataset(config.dataset().csv_path(), bridgewatch::factory::BuildSchema(config),
                                                       {config.dataset().timestamp_column()});
    auto repository = bridgewatch::factory::BuildRepository(config);

    bridgewatch::runtime::CancellationToken token;
    bridgewatch::runtime::InstallStopSignalHandlers(token);

    bridgewatch::replay::FeedProducer producer(repository, dataset, config.dataset().train_ratio(), token);
    producer.Replay(options);

    repository->ConnectionHandle().Close();
    Shutdown();
  } catch (const std::exception& e) {
    BRIDGEWATCH_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  return 0;
}
