#include "pg_tx.hpp"

#include "internal/db/postgres/pg_error.hpp"
#include "internal/observability/logging.hpp"

namespace rowsweep::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  try {
    conn_ = pool->Acquire();
    tx_ = std::make_unique<pqxx::work>(*conn_);
  } catch (const std::exception& e) {
    throw ToStoreError(e);
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try { tx_->abort(); }
    catch (const std::exception& e) {
      ROWSWEEP_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    tx_->commit();
  } catch (const std::exception& e) {
    throw ToStoreError(e);
  }
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
