#include "internal/replay/feed_producer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace bridgewatch::replay {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kHeadlineChannels[] = {"strain_microstrain", "vibration_ms2", "structural_health_index_shi"};

int64_t AsInt(std::size_t v) {
  return static_cast<int64_t>(v);
}

} // namespace

ReplayOptions ReplayOptions::FromConfig(const bridgewatch::runtime::config::RuntimeConfig& config) {
  ReplayOptions options;
  options.max_count    = static_cast<std::size_t>(config.replay().max_count());
  options.interval_sec = config.replay().interval_sec();
  return options;
}

FeedProducer::FeedProducer(std::shared_ptr<db::Repository> repository, const HistoricalDataset& dataset, double train_ratio,
                           const runtime::CancellationToken& token, runtime::Sleeper sleeper)
    : repository_(std::move(repository)), token_(token), sleeper_(std::move(sleeper)) {
  if (!repository_) {
    throw std::invalid_argument("feed producer needs a repository");
  }
  const auto& schema = repository_->Schema();
  if (dataset.channels != schema.Channels() || dataset.text_columns != schema.TextColumns()) {
    throw std::invalid_argument("dataset columns do not match the store schema");
  }

  split_index_ = replay::SplitIndex(dataset.Size(), train_ratio);
  rows_.assign(dataset.rows.begin() + static_cast<std::ptrdiff_t>(split_index_), dataset.rows.end());

  for (const char* channel : kHeadlineChannels) {
    if (auto index = schema.IndexOf(channel)) headline_.push_back(*index);
  }
  if (!sleeper_) {
    sleeper_ = runtime::InterruptibleSleeper(token_);
  }
}

ReplayReport FeedProducer::Replay(const ReplayOptions& options) {
  if (options.interval_sec < 0.0) {
    throw std::invalid_argument("replay interval must be >= 0 seconds");
  }
  const auto interval = util::SecondsToMillis(options.interval_sec);

  ReplayReport report;
  report.planned = options.max_count == 0 ? rows_.size() : std::min(options.max_count, rows_.size());

  BRIDGEWATCH_LOG_INFO("Replay started", {IntField("planned", AsInt(report.planned)), IntField("available", AsInt(rows_.size())),
                                          IntField("split_index", AsInt(split_index_)), IntField("interval_ms", interval.count())});

  for (std::size_t i = 0; i < report.planned; ++i) {
    if (token_.StopRequested()) {
      report.cancelled = true;
      break;
    }

    ++report.attempted;
    if (InsertOne(i, report.planned)) {
      ++report.inserted;
    } else {
      ++report.failed;
    }

    if (i + 1 < report.planned) {
      sleeper_(interval);
    }
  }

  BRIDGEWATCH_LOG_INFO(report.cancelled ? "Replay interrupted" : "Replay complete",
                       {IntField("planned", AsInt(report.planned)), IntField("attempted", AsInt(report.attempted)),
                        IntField("inserted", AsInt(report.inserted)), IntField("failed", AsInt(report.failed))});
  return report;
}

bool FeedProducer::InsertOne(std::size_t position, std::size_t planned) {
  const auto& source = rows_[position];

  // Outcome and historical capture time are not carried over.
  db::model::TelemetryRecord record;
  record.features       = source.values;
  record.texts          = source.texts;
  record.observed_at_ms = util::ToUnixMillis(util::Now());

  auto& metrics = observability::Metrics::Instance();
  try {
    auto tx     = repository_->Begin();
    auto result = repository_->InsertRecord(*tx, record);
    if (!result) {
      tx->Rollback();
      metrics.RecordInsert("replay", false);
      BRIDGEWATCH_LOG_WARN("Replay insert failed, skipping record",
                           {IntField("sequence", AsInt(position + 1)), StringField("code", db::ToString(result.code)),
                            StringField("error", result.message)});
      return false;
    }
    tx->Commit();
  } catch (const db::StoreError& e) {
    metrics.RecordInsert("replay", false);
    BRIDGEWATCH_LOG_WARN("Replay insert failed, skipping record",
                         {IntField("sequence", AsInt(position + 1)), StringField("code", db::ToString(e.Code())), StringField("error", e.what())});
    return false;
  }
  metrics.RecordInsert("replay", true);

  const auto& channels = repository_->Schema().Channels();
  const auto  percent  = 100.0 * static_cast<double>(position + 1) / static_cast<double>(planned);
  std::string headline;
  for (auto index : headline_) {
    if (!headline.empty()) headline += ' ';
    const auto& value = record.features[index];
    headline += channels[index] + "=" + (value ? std::to_string(*value) : std::string("null"));
  }
  BRIDGEWATCH_LOG_INFO("Inserted record", {IntField("sequence", AsInt(position + 1)), IntField("id", record.id),
                                           StringField("observed_at", util::FormatTimestamp(record.observed_at_ms)),
                                           StringField("channels", headline), DoubleField("percent", percent, 1)});
  return true;
}

} // namespace bridgewatch::replay
