#include "internal/replay/feed_producer.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/errors.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/time.hpp"

namespace {

using bridgewatch::db::ErrorCode;
using bridgewatch::db::Result;
using bridgewatch::db::memory::MemoryRepository;
using bridgewatch::db::model::Outcome;
using bridgewatch::db::model::OutcomeUpdate;
using bridgewatch::db::model::TelemetryRecord;
using bridgewatch::model::FeatureSchema;
using bridgewatch::replay::DatasetRow;
using bridgewatch::replay::FeedProducer;
using bridgewatch::replay::HistoricalDataset;
using bridgewatch::replay::ReplayOptions;
using bridgewatch::runtime::CancellationToken;

const std::vector<std::string> kChannels = {"strain_microstrain", "vibration_ms2", "temperature_c"};

// Row i carries strain i, an old capture time and a stale label.
HistoricalDataset Dataset(std::size_t n) {
  HistoricalDataset dataset;
  dataset.channels = kChannels;
  for (std::size_t i = 0; i < n; ++i) {
    DatasetRow row;
    row.values         = {static_cast<double>(i), 0.1, std::nullopt};
    row.recorded_at_ms = 1000;
    row.outcome        = Outcome{true, -0.3};
    dataset.rows.push_back(row);
  }
  return dataset;
}

std::shared_ptr<MemoryRepository> Store() {
  return std::make_shared<MemoryRepository>(FeatureSchema("bridge_telemetry", kChannels));
}

std::vector<TelemetryRecord> Stored(MemoryRepository& store) {
  auto tx = store.Begin();
  return store.ListRecords(*tx);
}

// Fails the inserts whose 1-based call number is listed.
class FailingInsertRepository final : public bridgewatch::db::Repository {
 public:
  FailingInsertRepository(std::shared_ptr<MemoryRepository> inner, std::set<int> fail_calls, bool unavailable)
      : inner_(std::move(inner)), fail_calls_(std::move(fail_calls)), unavailable_(unavailable) {
  }

  std::unique_ptr<bridgewatch::db::Transaction> Begin() override {
    return inner_->Begin();
  }
  bridgewatch::db::Connection& ConnectionHandle() override {
    return inner_->ConnectionHandle();
  }
  const FeatureSchema& Schema() const override {
    return inner_->Schema();
  }

  Result InsertRecord(bridgewatch::db::Transaction& t, TelemetryRecord& r) override {
    if (fail_calls_.count(++calls_) > 0) {
      if (unavailable_) throw bridgewatch::db::StoreUnavailable("connection reset");
      return Result::Err(ErrorCode::ConstraintViolation, "injected insert failure");
    }
    return inner_->InsertRecord(t, r);
  }

  std::optional<TelemetryRecord> GetRecord(bridgewatch::db::Transaction& t, int64_t id) override {
    return inner_->GetRecord(t, id);
  }
  std::vector<TelemetryRecord> ListRecords(bridgewatch::db::Transaction& t) override {
    return inner_->ListRecords(t);
  }
  std::vector<TelemetryRecord> FetchPending(bridgewatch::db::Transaction& t, std::size_t limit) override {
    return inner_->FetchPending(t, limit);
  }
  Result ApplyOutcomes(bridgewatch::db::Transaction& t, const std::vector<OutcomeUpdate>& updates) override {
    return inner_->ApplyOutcomes(t, updates);
  }
  Result Truncate(bridgewatch::db::Transaction& t) override {
    return inner_->Truncate(t);
  }
  uint64_t CountTotal(bridgewatch::db::Transaction& t) override {
    return inner_->CountTotal(t);
  }
  uint64_t CountPending(bridgewatch::db::Transaction& t) override {
    return inner_->CountPending(t);
  }
  uint64_t CountAnomalies(bridgewatch::db::Transaction& t) override {
    return inner_->CountAnomalies(t);
  }

 private:
  std::shared_ptr<MemoryRepository> inner_;
  std::set<int>                     fail_calls_;
  bool                              unavailable_;
  int                               calls_ = 0;
};

struct RecordingSleeper {
  std::vector<std::chrono::milliseconds>* sleeps;

  void operator()(std::chrono::milliseconds d) const {
    sleeps->push_back(d);
  }
};

void TestReplaysOnlyTheSuffix() {
  auto                                   store = Store();
  CancellationToken                      token;
  std::vector<std::chrono::milliseconds> sleeps;

  FeedProducer producer(store, Dataset(10), 0.7, token, RecordingSleeper{&sleeps});
  assert(producer.SplitIndex() == 7);
  assert(producer.Available() == 3);

  auto report = producer.Replay(ReplayOptions{0, 0.0});
  assert(report.planned == 3);
  assert(report.inserted == 3);
  assert(report.failed == 0);
  assert(!report.cancelled);

  auto records = Stored(*store);
  assert(records.size() == 3);
  for (std::size_t i = 0; i < records.size(); ++i) {
    // strain 7, 8, 9: nothing from the training prefix
    assert(*records[i].features[0] == static_cast<double>(7 + i));
  }
}

void TestSplitSizesForOddCounts() {
  CancellationToken token;
  for (std::size_t n : {1u, 3u, 17u, 100u, 1001u}) {
    FeedProducer producer(Store(), Dataset(n), 0.7, token, [](std::chrono::milliseconds) {});
    const auto   k = static_cast<std::size_t>(static_cast<double>(n) * 0.7);
    assert(producer.SplitIndex() == k);
    assert(producer.Available() == n - k);
  }
}

void TestInsertsArePendingAndStampedNow() {
  auto              store = Store();
  CancellationToken token;

  const auto   before = bridgewatch::util::ToUnixMillis(bridgewatch::util::Now());
  FeedProducer producer(store, Dataset(10), 0.5, token, [](std::chrono::milliseconds) {});
  producer.Replay(ReplayOptions{0, 0.0});
  const auto after = bridgewatch::util::ToUnixMillis(bridgewatch::util::Now());

  auto records = Stored(*store);
  assert(records.size() == 5);
  int64_t last_id = 0;
  for (const auto& record : records) {
    assert(record.IsPending());
    assert(record.observed_at_ms >= before && record.observed_at_ms <= after);
    assert(!record.features[2].has_value());
    assert(record.id > last_id);
    last_id = record.id;
  }
}

void TestMaxCountAndNoTrailingSleep() {
  auto                                   store = Store();
  CancellationToken                      token;
  std::vector<std::chrono::milliseconds> sleeps;

  FeedProducer producer(store, Dataset(20), 0.0, token, RecordingSleeper{&sleeps});
  auto         report = producer.Replay(ReplayOptions{4, 0.25});

  assert(report.planned == 4);
  assert(report.attempted == 4);
  assert(report.inserted == 4);
  assert(Stored(*store).size() == 4);
  // between inserts only
  assert(sleeps.size() == 3);
  for (auto d : sleeps) assert(d == std::chrono::milliseconds(250));
}

void TestMaxCountLargerThanAvailable() {
  CancellationToken token;
  FeedProducer      producer(Store(), Dataset(10), 0.7, token, [](std::chrono::milliseconds) {});
  auto              report = producer.Replay(ReplayOptions{50, 0.0});
  assert(report.planned == 3);
  assert(report.inserted == 3);
}

void TestFailedInsertIsSkipped() {
  auto              store = Store();
  auto              repo  = std::make_shared<FailingInsertRepository>(store, std::set<int>{2}, false);
  CancellationToken token;

  FeedProducer producer(repo, Dataset(10), 0.6, token, [](std::chrono::milliseconds) {});
  auto         report = producer.Replay(ReplayOptions{0, 0.0});

  assert(report.attempted == 4);
  assert(report.inserted == 3);
  assert(report.failed == 1);

  auto records = Stored(*store);
  assert(records.size() == 3);
  // strain 7 was the failed second row; no retry
  assert(*records[0].features[0] == 6.0);
  assert(*records[1].features[0] == 8.0);
  assert(*records[2].features[0] == 9.0);
}

void TestConnectionErrorOnInsertIsSkipped() {
  auto              store = Store();
  auto              repo  = std::make_shared<FailingInsertRepository>(store, std::set<int>{1, 3}, true);
  CancellationToken token;

  FeedProducer producer(repo, Dataset(4), 0.0, token, [](std::chrono::milliseconds) {});
  auto         report = producer.Replay(ReplayOptions{0, 0.0});

  assert(report.attempted == 4);
  assert(report.inserted == 2);
  assert(report.failed == 2);
  assert(Stored(*store).size() == 2);
}

void TestStopRequestEndsReplay() {
  auto              store = Store();
  CancellationToken token;
  int               sleeps = 0;

  FeedProducer producer(store, Dataset(10), 0.0, token, [&](std::chrono::milliseconds) {
    if (++sleeps == 2) token.RequestStop();
  });
  auto report = producer.Replay(ReplayOptions{0, 1.0});

  assert(report.cancelled);
  assert(report.planned == 10);
  assert(report.attempted == 2);
  assert(report.inserted == 2);
  assert(Stored(*store).size() == 2);
}

void TestNegativeIntervalIsRejected() {
  CancellationToken token;
  FeedProducer      producer(Store(), Dataset(10), 0.7, token, [](std::chrono::milliseconds) {});

  bool threw = false;
  try {
    producer.Replay(ReplayOptions{0, -1.0});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestTextColumnsAreCarriedThrough() {
  auto store = std::make_shared<MemoryRepository>(FeatureSchema("bridge_telemetry", kChannels, {"bridge_mood_meter"}));

  auto dataset          = Dataset(4);
  dataset.text_columns  = {"bridge_mood_meter"};
  dataset.rows[2].texts = {std::string("grumpy")};
  dataset.rows[3].texts = {std::nullopt};

  CancellationToken                      token;
  std::vector<std::chrono::milliseconds> sleeps;
  FeedProducer                           producer(store, dataset, 0.5, token, RecordingSleeper{&sleeps});
  auto                                   report = producer.Replay(ReplayOptions{0, 0.0});
  assert(report.inserted == 2);

  auto records = Stored(*store);
  assert(records.size() == 2);
  assert(records[0].texts.size() == 1);
  assert(records[0].texts[0] == std::string("grumpy"));
  assert(!records[1].texts[0].has_value());

  // a dataset without the store's text columns is refused
  bool threw = false;
  try {
    FeedProducer mismatched(store, Dataset(4), 0.5, token, RecordingSleeper{&sleeps});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestDatasetMustMatchStoreSchema() {
  CancellationToken token;
  auto              dataset = Dataset(4);
  dataset.channels          = {"strain_microstrain", "vibration_ms2", "humidity_percent"};

  bool threw = false;
  try {
    FeedProducer producer(Store(), dataset, 0.5, token);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestReplaysOnlyTheSuffix();
  TestSplitSizesForOddCounts();
  TestInsertsArePendingAndStampedNow();
  TestMaxCountAndNoTrailingSleep();
  TestMaxCountLargerThanAvailable();
  TestFailedInsertIsSkipped();
  TestConnectionErrorOnInsertIsSkipped();
  TestStopRequestEndsReplay();
  TestNegativeIntervalIsRejected();
  TestTextColumnsAreCarriedThrough();
  TestDatasetMustMatchStoreSchema();

  std::cout << "bridgewatch_unit_feed_producer: pass\n";
  return 0;
}
