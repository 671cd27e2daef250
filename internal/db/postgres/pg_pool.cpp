#include "pg_pool.hpp"

namespace weave::db::postgres {

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
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
        } catch (const std::exception&) {
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
  conn.prepare("last_sequence", "SELECT COALESCE(MAX(sequence), 0) FROM events WHERE run_id=$1");

  conn.prepare("insert_event",
               "INSERT INTO events(run_id,sequence,event_type,event_time_ms,data) "
               "VALUES($1,$2,$3,$4,decode($5,'hex'))");

  conn.prepare("select_events",
               "SELECT run_id,sequence,event_type,event_time_ms,encode(data,'hex') "
               "FROM events WHERE run_id=$1 AND sequence>$2 ORDER BY sequence ASC LIMIT $3");

  // SKIP LOCKED lets concurrent pollers lease different rows
  conn.prepare("next_visible_task",
               "SELECT task_id FROM tasks WHERE queue_name=$1 AND visible_at_ms<=$2 "
               "ORDER BY visible_at_ms ASC, seq ASC LIMIT 1 FOR UPDATE SKIP LOCKED");
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
  // a dropped server connection is discarded, the next Acquire() reconnects
  const bool reusable = conn->is_open();
  if (!reusable) delete conn;
  {
    std::lock_guard lock(mutex_);
    if (reusable) {
      idle_.emplace_back(conn);
    } else {
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace weave::db::postgres
