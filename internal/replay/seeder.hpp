#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/replay/csv_dataset.hpp"

namespace bridgewatch::replay {

struct SeedOptions {
  std::size_t chunk_size        = 5000;
  bool        truncate_existing = false;

  static SeedOptions FromConfig(const bridgewatch::runtime::config::RuntimeConfig& config);
};

struct SeedReport {
  std::size_t   seeded    = 0;
  bool          truncated = false;
  std::uint64_t total     = 0;
  std::uint64_t pending   = 0;
};

/*
  Loads the training prefix [0, SplitIndex) into an empty store.

  Rows are written in chunk_size transactions. A non-empty store is refused
  with util::StoreNotEmpty unless truncate_existing is set. A failed chunk is
  rolled back and aborts the run with db::StoreError.
*/
class Seeder {
 public:
  Seeder(std::shared_ptr<db::Repository> repository, const HistoricalDataset& dataset, double train_ratio, SeedOptions options);

  SeedReport Run();

 private:
  void InsertChunk(std::size_t begin, std::size_t end, std::int64_t now_ms);

  std::shared_ptr<db::Repository> repository_;
  const HistoricalDataset&        dataset_;
  std::size_t                     split_index_ = 0;
  SeedOptions                     options_;
};

} // namespace bridgewatch::replay
