#include "internal/replay/seeder.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace bridgewatch::replay {

using observability::BoolField;
using observability::IntField;

namespace {

int64_t AsInt(std::uint64_t v) {
  return static_cast<int64_t>(v);
}

} // namespace

SeedOptions SeedOptions::FromConfig(const bridgewatch::runtime::config::RuntimeConfig& config) {
  SeedOptions options;
  options.chunk_size        = config.seed().chunk_size();
  options.truncate_existing = config.seed().truncate_existing();
  return options;
}

Seeder::Seeder(std::shared_ptr<db::Repository> repository, const HistoricalDataset& dataset, double train_ratio, SeedOptions options)
    : repository_(std::move(repository)), dataset_(dataset), options_(options) {
  if (!repository_) {
    throw std::invalid_argument("seeder needs a repository");
  }
  if (options_.chunk_size == 0) {
    throw std::invalid_argument("seed chunk size must be positive");
  }
  if (dataset_.channels != repository_->Schema().Channels() || dataset_.text_columns != repository_->Schema().TextColumns()) {
    throw std::invalid_argument("dataset columns do not match the store schema");
  }
  split_index_ = SplitIndex(dataset_.Size(), train_ratio);
}

SeedReport Seeder::Run() {
  observability::SpanScope span("seed.run");
  SeedReport               report;

  {
    auto       tx       = repository_->Begin();
    const auto existing = repository_->CountTotal(*tx);
    if (existing > 0) {
      if (!options_.truncate_existing) {
        tx->Rollback();
        throw util::StoreNotEmpty("table " + repository_->Schema().Table() + " already holds " + std::to_string(existing) +
                                  " records; rerun with truncation enabled to replace them");
      }
      db::ThrowIfError(repository_->Truncate(*tx), "truncate");
      report.truncated = true;
      BRIDGEWATCH_LOG_WARN("Existing records removed", {IntField("removed", AsInt(existing))});
    }
    tx->Commit();
  }

  if (split_index_ == 0) {
    BRIDGEWATCH_LOG_WARN("Training prefix is empty, nothing to seed", {IntField("dataset_rows", AsInt(dataset_.Size()))});
  }

  const auto now_ms = util::ToUnixMillis(util::Now());
  for (std::size_t begin = 0; begin < split_index_; begin += options_.chunk_size) {
    const auto end = std::min(begin + options_.chunk_size, split_index_);
    InsertChunk(begin, end, now_ms);
    report.seeded = end;
    BRIDGEWATCH_LOG_INFO("Seeded chunk", {IntField("inserted", AsInt(end)), IntField("of", AsInt(split_index_))});
  }

  {
    auto tx        = repository_->Begin();
    report.total   = repository_->CountTotal(*tx);
    report.pending = repository_->CountPending(*tx);
    tx->Commit();
  }

  span.SetAttribute("seeded", AsInt(report.seeded));
  BRIDGEWATCH_LOG_INFO("Seeding complete", {IntField("seeded", AsInt(report.seeded)), IntField("held_back", AsInt(dataset_.Size() - split_index_)),
                                            IntField("total", AsInt(report.total)), IntField("pending", AsInt(report.pending)),
                                            BoolField("truncated", report.truncated)});
  return report;
}

void Seeder::InsertChunk(std::size_t begin, std::size_t end, std::int64_t now_ms) {
  auto tx = repository_->Begin();
  for (std::size_t i = begin; i < end; ++i) {
    const auto& row = dataset_.rows[i];

    db::model::TelemetryRecord record;
    record.features       = row.values;
    record.texts          = row.texts;
    record.observed_at_ms = row.recorded_at_ms.value_or(now_ms);

    auto result = repository_->InsertRecord(*tx, record);
    if (!result) {
      tx->Rollback();
      db::Throw(result, "seed row " + std::to_string(i));
    }
  }
  tx->Commit();
}

} // namespace bridgewatch::replay
