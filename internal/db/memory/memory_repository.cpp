#include "memory_repository.hpp"

#include <string>

#include "memory_tx.hpp"

namespace bridgewatch::db::memory {

MemoryRepository::MemoryRepository(bridgewatch::model::FeatureSchema schema) : schema_(std::move(schema)) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

bool MemoryRepository::IsHealthy() {
  std::scoped_lock lock(mutex_);
  return open_;
}

void MemoryRepository::Reconnect() {
  std::scoped_lock lock(mutex_);
  open_ = true;
}

void MemoryRepository::Close() {
  std::scoped_lock lock(mutex_);
  open_ = false;
}

Result MemoryRepository::InsertRecord(Transaction& t, model::TelemetryRecord& r) {
  if (r.features.size() != schema_.Width()) {
    return Result::Err(ErrorCode::InvalidArgument, "record has " + std::to_string(r.features.size()) + " features, table " + schema_.Table() +
                                                       " has " + std::to_string(schema_.Width()) + " channels");
  }
  if (!r.texts.empty() && r.texts.size() != schema_.TextWidth()) {
    return Result::Err(ErrorCode::InvalidArgument, "record has " + std::to_string(r.texts.size()) + " text values, table " + schema_.Table() +
                                                       " has " + std::to_string(schema_.TextWidth()) + " text columns");
  }

  auto& s = TX(t).Mutable();
  r.id    = s.next_id++;

  model::TelemetryRecord stored;
  stored.id             = r.id;
  stored.observed_at_ms = r.observed_at_ms;
  stored.features       = r.features;
  stored.texts          = r.texts.empty() ? model::TextRow(schema_.TextWidth()) : r.texts;
  s.records.emplace(stored.id, std::move(stored));
  return Result::Ok();
}

std::optional<model::TelemetryRecord> MemoryRepository::GetRecord(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.records.find(id);
  if (it == s.records.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TelemetryRecord> MemoryRepository::ListRecords(Transaction& t) {
  const auto&                         s = TX(t).View();
  std::vector<model::TelemetryRecord> records;
  records.reserve(s.records.size());
  for (const auto& [_, record] : s.records) {
    records.push_back(record);
  }
  return records;
}

std::vector<model::TelemetryRecord> MemoryRepository::FetchPending(Transaction& t, std::size_t limit) {
  std::vector<model::TelemetryRecord> out;
  for (const auto& [_, record] : TX(t).View().records) {
    if (out.size() >= limit) break;
    if (record.IsPending()) out.push_back(record);
  }
  return out;
}

Result MemoryRepository::ApplyOutcomes(Transaction& t, const std::vector<model::OutcomeUpdate>& updates) {
  auto& s = TX(t).Mutable();
  for (const auto& u : updates) {
    auto it = s.records.find(u.id);
    if (it == s.records.end() || !it->second.IsPending()) {
      return Result::Err(ErrorCode::Conflict, "record " + std::to_string(u.id) + " is not pending");
    }
    it->second.outcome = model::Outcome{u.is_anomaly, u.anomaly_score};
  }
  return Result::Ok();
}

Result MemoryRepository::Truncate(Transaction& t) {
  auto& s = TX(t).Mutable();
  s.records.clear();
  s.next_id = 1;
  return Result::Ok();
}

uint64_t MemoryRepository::CountTotal(Transaction& t) {
  return TX(t).View().records.size();
}

uint64_t MemoryRepository::CountPending(Transaction& t) {
  uint64_t n = 0;
  for (const auto& [_, record] : TX(t).View().records)
    if (record.IsPending()) ++n;
  return n;
}

uint64_t MemoryRepository::CountAnomalies(Transaction& t) {
  uint64_t n = 0;
  for (const auto& [_, record] : TX(t).View().records)
    if (record.outcome && record.outcome->is_anomaly) ++n;
  return n;
}

} // namespace bridgewatch::db::memory
