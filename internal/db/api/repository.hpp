#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/model/task_status.hpp"

namespace taskengine::db {

// Which timestamp an age query compares against.
enum class AgeField {
  kCreatedAt,
  kUpdatedAt,
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access requires a Transaction
  - Reads inside a transaction see its writes
  - Existing rows are only ever changed through CompareAndSwapTask;
    there is no blind overwrite
  - Version checks and the write happen atomically

  The DB is the source of truth for task state. The in-memory registry
  only shadows tasks while a worker owns them.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Task lifecycle
  // ---------------------------------------------------------------------

  // AlreadyExists when the id is taken.
  virtual Result InsertTask(Transaction&, const model::TaskRecord&) = 0;

  virtual std::optional<model::TaskRecord> GetTask(Transaction&, const std::string& id) = 0;

  // Writes `record` (including record.version) only if the stored row
  // still carries `expected_version`. Conflict on mismatch, NotFound if
  // the row is gone.
  virtual Result CompareAndSwapTask(Transaction&, const model::TaskRecord& record, uint64_t expected_version) = 0;

  // Deleting a missing row is not an error.
  virtual Result DeleteTask(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Queries
  // ---------------------------------------------------------------------

  // Rows in `status` whose age field is strictly below cutoff_ms.
  virtual std::vector<model::TaskRecord> FindByStatusOlderThan(Transaction&, taskengine::model::TaskStatus status, AgeField field,
                                                               uint64_t cutoff_ms) = 0;

  virtual std::vector<model::TaskRecord> ListTasksByStatus(Transaction&, taskengine::model::TaskStatus status) = 0;

  virtual uint64_t CountTasks(Transaction&, taskengine::model::TaskStatus status) = 0;
};

} // namespace taskengine::db
