#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/replay/csv_dataset.hpp"
#include "internal/runtime/cancellation.hpp"

namespace bridgewatch::replay {

struct ReplayOptions {
  // 0 replays every held-back row
  std::size_t max_count = 0;
  // seconds between insertions; negative is rejected
  double interval_sec = 1.0;

  static ReplayOptions FromConfig(const bridgewatch::runtime::config::RuntimeConfig& config);
};

struct ReplayReport {
  std::size_t planned   = 0;
  std::size_t attempted = 0;
  std::size_t inserted  = 0;
  std::size_t failed    = 0;
  bool        cancelled = false;
};

/*
  Simulated sensor feed.

  Holds the rows after the split boundary and inserts them one at a time as
  fresh pending records stamped with the insertion time. A failed insert is
  logged and skipped. Stop requests are checked before every insert.
*/
class FeedProducer {
 public:
  FeedProducer(std::shared_ptr<db::Repository> repository, const HistoricalDataset& dataset, double train_ratio,
               const runtime::CancellationToken& token, runtime::Sleeper sleeper = {});

  // First dataset row that is replayed.
  std::size_t SplitIndex() const { return split_index_; }

  // Rows held back for replay.
  std::size_t Available() const { return rows_.size(); }

  ReplayReport Replay(const ReplayOptions& options);

 private:
  bool InsertOne(std::size_t position, std::size_t planned);

  std::shared_ptr<db::Repository>    repository_;
  std::vector<DatasetRow>            rows_;
  std::size_t                        split_index_ = 0;
  const runtime::CancellationToken&  token_;
  runtime::Sleeper                   sleeper_;

  // headline channels for the progress line, when the schema has them
  std::vector<std::size_t> headline_;
};

} // namespace bridgewatch::replay
