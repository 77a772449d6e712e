#include "pg_pool.hpp"

namespace taskengine::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_task",
               "SELECT id,kind,x,y,current,status,created_at_ms,updated_at_ms,version,error_message "
               "FROM task WHERE id=$1");

  conn.prepare("insert_task",
               "INSERT INTO task(id,kind,x,y,current,status,created_at_ms,updated_at_ms,version,error_message) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10)");

  conn.prepare("cas_task",
               "UPDATE task SET kind=$2,x=$3,y=$4,current=$5,status=$6,created_at_ms=$7,updated_at_ms=$8,version=$9,error_message=$10 "
               "WHERE id=$1 AND version=$11");

  conn.prepare("delete_task", "DELETE FROM task WHERE id=$1");

  conn.prepare("list_tasks_by_status",
               "SELECT id,kind,x,y,current,status,created_at_ms,updated_at_ms,version,error_message "
               "FROM task WHERE status=$1 ORDER BY created_at_ms");

  conn.prepare("find_by_status_created_before",
               "SELECT id,kind,x,y,current,status,created_at_ms,updated_at_ms,version,error_message "
               "FROM task WHERE status=$1 AND created_at_ms < $2 ORDER BY created_at_ms");

  conn.prepare("find_by_status_updated_before",
               "SELECT id,kind,x,y,current,status,created_at_ms,updated_at_ms,version,error_message "
               "FROM task WHERE status=$1 AND updated_at_ms < $2 ORDER BY created_at_ms");

  conn.prepare("count_tasks_by_status", "SELECT COUNT(*) FROM task WHERE status=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace taskengine::db::postgres
