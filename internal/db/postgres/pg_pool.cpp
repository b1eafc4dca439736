#include "pg_pool.hpp"

namespace rowsweep::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (conn->is_open()) return Wrap(conn.release());
      --live_connections_;
      continue;
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      std::unique_ptr<pqxx::connection> conn;
      try {
        conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
      return Wrap(conn.release());
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("count_tickets", "SELECT COUNT(*) FROM ticket");

  conn.prepare("select_tickets_by_offset",
               "SELECT id, token FROM ticket ORDER BY id LIMIT $1 OFFSET $2");

  conn.prepare("select_tickets_first", "SELECT id, token FROM ticket ORDER BY id LIMIT $1");

  conn.prepare("select_tickets_after",
               "SELECT id, token FROM ticket WHERE id > $1 ORDER BY id LIMIT $2");

  conn.prepare("select_ticket_key_at", "SELECT id FROM ticket ORDER BY id LIMIT 1 OFFSET $1");

  conn.prepare("update_ticket_token", "UPDATE ticket SET token=$2 WHERE id=$1");

  conn.prepare("insert_ticket", "INSERT INTO ticket(token) VALUES($1)");

  conn.prepare("insert_ticket_with_id", "INSERT INTO ticket(id, token) VALUES($1, $2)");
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

} // namespace rowsweep::db::postgres
