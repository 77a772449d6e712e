#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace taskengine::db::memory {

using taskengine::model::TaskStatus;

namespace {

uint64_t AgeOf(const model::TaskRecord& record, AgeField field) {
  return field == AgeField::kCreatedAt ? record.created_at_ms : record.updated_at_ms;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.tasks.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  TX(t).RecordUndo(r.id);
  s.tasks[r.id] = r;
  return Result::Ok();
}

std::optional<model::TaskRecord> MemoryRepository::GetTask(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.tasks.find(id);
  if (it == s.tasks.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::CompareAndSwapTask(Transaction& t, const model::TaskRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tasks.find(r.id);
  if (it == s.tasks.end()) return Result::Err(ErrorCode::NotFound, r.id);
  if (it->second.version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "expected version " + std::to_string(expected_version) + ", found " +
                                                std::to_string(it->second.version));
  }
  TX(t).RecordUndo(r.id);
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteTask(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (!s.tasks.contains(id)) return Result::Ok();
  TX(t).RecordUndo(id);
  s.tasks.erase(id);
  return Result::Ok();
}

std::vector<model::TaskRecord> MemoryRepository::FindByStatusOlderThan(Transaction& t, TaskStatus status, AgeField field, uint64_t cutoff_ms) {
  std::vector<model::TaskRecord> out;
  for (const auto& [_, record] : TX(t).View().tasks) {
    if (record.status == status && AgeOf(record, field) < cutoff_ms) out.push_back(record);
  }
  return out;
}

std::vector<model::TaskRecord> MemoryRepository::ListTasksByStatus(Transaction& t, TaskStatus status) {
  std::vector<model::TaskRecord> out;
  for (const auto& [_, record] : TX(t).View().tasks) {
    if (record.status == status) out.push_back(record);
  }
  return out;
}

uint64_t MemoryRepository::CountTasks(Transaction& t, TaskStatus status) {
  uint64_t count = 0;
  for (const auto& [_, record] : TX(t).View().tasks) {
    if (record.status == status) ++count;
  }
  return count;
}

} // namespace taskengine::db::memory
