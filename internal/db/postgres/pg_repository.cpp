#include "pg_repository.hpp"

#include <stdexcept>
#include <string>

namespace taskengine::db::postgres {

using taskengine::model::TaskStatus;

namespace {

TaskStatus ReadStatus(const pqxx::field& field) {
  const int  raw    = field.as<int>();
  const auto status = taskengine::model::StatusFromInt(raw);
  if (!status) {
    throw std::runtime_error("postgres: unknown task status " + std::to_string(raw));
  }
  return *status;
}

model::TaskRecord ReadRow(const pqxx::row& row) {
  model::TaskRecord r;
  r.id            = row[0].c_str();
  r.kind          = row[1].c_str();
  r.x             = row[2].as<int64_t>();
  r.y             = row[3].as<int64_t>();
  r.current       = row[4].as<int64_t>();
  r.status        = ReadStatus(row[5]);
  r.created_at_ms = row[6].as<uint64_t>();
  r.updated_at_ms = row[7].as<uint64_t>();
  r.version       = row[8].as<uint64_t>();
  r.error_message = row[9].is_null() ? "" : row[9].c_str();
  return r;
}

std::vector<model::TaskRecord> ReadRows(const pqxx::result& res) {
  std::vector<model::TaskRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRow(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_task", r.id, r.kind, r.x, r.y, r.current, static_cast<int>(r.status), r.created_at_ms, r.updated_at_ms,
                               r.version, r.error_message);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TaskRecord> PgRepository::GetTask(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_task", id);
  if (res.empty()) return std::nullopt;
  return ReadRow(res[0]);
}

Result PgRepository::CompareAndSwapTask(Transaction& t, const model::TaskRecord& r, uint64_t expected_version) {
  try {
    auto res = TX(t).Work().exec_prepared("cas_task", r.id, r.kind, r.x, r.y, r.current, static_cast<int>(r.status), r.created_at_ms,
                                          r.updated_at_ms, r.version, r.error_message, expected_version);
    if (res.affected_rows() == 1) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }

  if (!GetTask(t, r.id)) return Result::Err(ErrorCode::NotFound, r.id);
  return Result::Err(ErrorCode::Conflict, "version mismatch for " + r.id);
}

Result PgRepository::DeleteTask(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_prepared("delete_task", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TaskRecord> PgRepository::FindByStatusOlderThan(Transaction& t, TaskStatus status, AgeField field, uint64_t cutoff_ms) {
  const char* statement = field == AgeField::kCreatedAt ? "find_by_status_created_before" : "find_by_status_updated_before";
  return ReadRows(TX(t).Work().exec_prepared(statement, static_cast<int>(status), cutoff_ms));
}

std::vector<model::TaskRecord> PgRepository::ListTasksByStatus(Transaction& t, TaskStatus status) {
  return ReadRows(TX(t).Work().exec_prepared("list_tasks_by_status", static_cast<int>(status)));
}

uint64_t PgRepository::CountTasks(Transaction& t, TaskStatus status) {
  auto res = TX(t).Work().exec_prepared("count_tasks_by_status", static_cast<int>(status));
  return res.empty() ? 0 : res[0][0].as<uint64_t>();
}

} // namespace taskengine::db::postgres
