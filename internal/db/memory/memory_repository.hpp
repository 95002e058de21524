#pragma once

#include <cstdint>
#include <map>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace bridgewatch::db::memory {

class MemoryTransaction;

/*
  In-process store.

  The committed state is a versioned snapshot; each transaction works on a
  private copy and installs it on commit. Close() makes the store refuse new
  transactions until Reconnect(), which is how tests simulate an outage.
*/
class MemoryRepository final : public db::Repository, private db::Connection {
public:
  explicit MemoryRepository(bridgewatch::model::FeatureSchema schema);

  std::unique_ptr<Transaction> Begin() override;
  Connection& ConnectionHandle() override { return *this; }
  const bridgewatch::model::FeatureSchema& Schema() const override { return schema_; }

  Result InsertRecord(Transaction&, model::TelemetryRecord&) override;
  std::optional<model::TelemetryRecord> GetRecord(Transaction&, int64_t id) override;
  std::vector<model::TelemetryRecord> ListRecords(Transaction&) override;
  std::vector<model::TelemetryRecord> FetchPending(Transaction&, std::size_t limit) override;
  Result ApplyOutcomes(Transaction&, const std::vector<model::OutcomeUpdate>&) override;
  Result Truncate(Transaction&) override;

  uint64_t CountTotal(Transaction&) override;
  uint64_t CountPending(Transaction&) override;
  uint64_t CountAnomalies(Transaction&) override;

private:
  friend class MemoryTransaction;

  bool IsHealthy() override;
  void Reconnect() override;
  void Close() override;

  struct State {
    std::map<int64_t, model::TelemetryRecord> records;
    int64_t next_id = 1;
  };

  bridgewatch::model::FeatureSchema schema_;

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
  bool open_ = true;
};

} // namespace bridgewatch::db::memory
