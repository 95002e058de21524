#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

static void Usage() {
  std::cout << "Usage:\n"
            << "  bridgewatchctl --config <config.yaml> stats\n"
            << "  bridgewatchctl --config <config.yaml> pending\n";
}

int main(int argc, char** argv) {
  if (argc != 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];
  if (cmd != "stats" && cmd != "pending") {
    Usage();
    return 1;
  }

  try {
    auto config = bridgewatch::config::ConfigLoader::LoadFromYaml(config_path);
    bridgewatch::observability::InitializeLogging(config, "bridgewatchctl");

    auto repository = bridgewatch::factory::BuildRepository(config);
    auto tx         = repository->Begin();

    // ------------------------------------------------------------

    if (cmd == "stats") {
      const auto total     = repository->CountTotal(*tx);
      const auto pending   = repository->CountPending(*tx);
      const auto anomalies = repository->CountAnomalies(*tx);
      tx->Commit();

      std::cout << "table=" << repository->Schema().Table() << "\n"
                << "total=" << total << "\n"
                << "scored=" << (total - pending) << "\n"
                << "pending=" << pending << "\n"
                << "anomalies=" << anomalies << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    const auto batch = repository->FetchPending(*tx, 10);
    tx->Commit();
    for (const auto& record : batch) {
      std::cout << "id=" << record.id << " observed_at_ms=" << record.observed_at_ms << "\n";
    }
    std::cout << "shown=" << batch.size() << "\n";
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  return 0;
}
