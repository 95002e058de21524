#include "internal/db/memory/memory_repository.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/db/api/errors.hpp"

namespace {

using bridgewatch::db::ErrorCode;
using bridgewatch::db::StoreError;
using bridgewatch::db::TxState;
using bridgewatch::db::memory::MemoryRepository;
using bridgewatch::db::model::OutcomeUpdate;
using bridgewatch::db::model::TelemetryRecord;
using bridgewatch::model::FeatureSchema;

FeatureSchema Schema() {
  return FeatureSchema("bridge_telemetry", {"strain_microstrain", "vibration_ms2"}, {"bridge_mood_meter"});
}

TelemetryRecord Record(double strain) {
  TelemetryRecord record;
  record.observed_at_ms = 1704067200000;
  record.features       = {strain, 0.1};
  return record;
}

void TestReadOnlyCommitDoesNotConflictWithWriter() {
  MemoryRepository store(Schema());

  auto writer = store.Begin();
  auto record = Record(1.0);
  assert(store.InsertRecord(*writer, record));

  // the scorer's anomaly count commits while the replay insert is in flight
  {
    auto reader = store.Begin();
    assert(store.CountAnomalies(*reader) == 0);
    assert(store.CountPending(*reader) == 0);
    reader->Commit();
    assert(reader->State() == TxState::kCommitted);
  }

  writer->Commit();
  assert(writer->State() == TxState::kCommitted);

  auto tx = store.Begin();
  assert(store.CountTotal(*tx) == 1);
}

void TestConcurrentWritersStillConflict() {
  MemoryRepository store(Schema());
  {
    auto tx     = store.Begin();
    auto record = Record(1.0);
    assert(store.InsertRecord(*tx, record));
    tx->Commit();
  }

  auto first  = store.Begin();
  auto second = store.Begin();
  assert(store.ApplyOutcomes(*first, {OutcomeUpdate{1, true, -0.2}}));
  assert(store.ApplyOutcomes(*second, {OutcomeUpdate{1, false, 0.1}}));
  first->Commit();

  bool conflicted = false;
  try {
    second->Commit();
  } catch (const StoreError& e) {
    conflicted = e.Code() == ErrorCode::Conflict;
  }
  assert(conflicted);
  assert(second->State() == TxState::kFailed);

  auto tx     = store.Begin();
  auto stored = store.GetRecord(*tx, 1);
  assert(stored->outcome->is_anomaly);
}

void TestMissingTextValuesAreStoredAbsent() {
  MemoryRepository store(Schema());
  auto             tx     = store.Begin();
  auto             record = Record(2.0);
  assert(store.InsertRecord(*tx, record));

  auto stored = store.GetRecord(*tx, record.id);
  assert(stored->texts.size() == 1);
  assert(!stored->texts[0].has_value());
  tx->Rollback();
}

} // namespace

int main() {
  TestReadOnlyCommitDoesNotConflictWithWriter();
  TestConcurrentWritersStillConflict();
  TestMissingTextValuesAreStoredAbsent();

  std::cout << "bridgewatch_unit_memory_repository: pass\n";
  return 0;
}
