#include "sqlite_record_store.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace rowsweep::db::sqlite {

using rowsweep::db::ErrorCode;
using rowsweep::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  int           rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
  if (rc != SQLITE_OK) {
    throw util::StoreError(SqliteDB::TranslateCode(rc), std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, std::uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

std::vector<model::TicketRecord> ReadTickets(sqlite3* db, sqlite3_stmt* st, std::uint64_t limit) {
  std::vector<model::TicketRecord> out;
  out.reserve(static_cast<std::size_t>(limit));

  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back({ColI64(st, 0), ColText(st, 1)});
  }
  if (rc != SQLITE_DONE) {
    throw util::StoreError(SqliteDB::TranslateCode(rc), std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

} // namespace

SqliteRecordStore::SqliteRecordStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRecordStore::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRecordStore::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRecordStore::Translate(sqlite3* db, int rc) {
  const ErrorCode code = SqliteDB::TranslateCode(rc);
  if (code == ErrorCode::OK) return Result::Ok();
  return Result::Err(code, sqlite3_errmsg(db));
}

void SqliteRecordStore::BootstrapSchema() {
  db_->Exec(sql::CREATE_TICKET_TABLE);
  db_->Exec("SELECT id,token FROM ticket LIMIT 1;");
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::uint64_t SqliteRecordStore::CountRecords(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::COUNT_TICKETS);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) {
    throw util::StoreError(SqliteDB::TranslateCode(rc), std::string("sqlite count: ") + sqlite3_errmsg(db));
  }
  return static_cast<std::uint64_t>(ColI64(st.get(), 0));
}

std::vector<model::TicketRecord> SqliteRecordStore::FetchByOffset(Transaction& t, std::uint64_t offset,
                                                                  std::uint64_t limit) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_TICKETS_BY_OFFSET);

  BindU64(st.get(), 1, limit);
  BindU64(st.get(), 2, offset);
  return ReadTickets(db, st.get(), limit);
}

std::vector<model::TicketRecord> SqliteRecordStore::FetchAfter(Transaction& t, std::optional<std::int64_t> after_id,
                                                               std::uint64_t limit) {
  auto* db = TX(t).Handle();

  if (!after_id) {
    auto st = Prepare(db, sql::SELECT_TICKETS_FIRST);
    BindU64(st.get(), 1, limit);
    return ReadTickets(db, st.get(), limit);
  }

  auto st = Prepare(db, sql::SELECT_TICKETS_AFTER);
  BindI64(st.get(), 1, *after_id);
  BindU64(st.get(), 2, limit);
  return ReadTickets(db, st.get(), limit);
}

std::optional<std::int64_t> SqliteRecordStore::KeyAtOffset(Transaction& t, std::uint64_t offset) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_TICKET_KEY_AT);
  BindU64(st.get(), 1, offset);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw util::StoreError(SqliteDB::TranslateCode(rc), std::string("sqlite key lookup: ") + sqlite3_errmsg(db));
  }
  return ColI64(st.get(), 0);
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

Result SqliteRecordStore::UpdateTokens(Transaction& t, const std::vector<model::TicketRecord>& records) {
  auto* db = TX(t).Handle();

  try {
    auto st = Prepare(db, sql::UPDATE_TICKET_TOKEN);
    for (const auto& r : records) {
      BindText(st.get(), 1, r.token);
      BindI64(st.get(), 2, r.id);

      int rc = sqlite3_step(st.get());
      if (rc != SQLITE_DONE) return Translate(db, rc);
      if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "ticket " + std::to_string(r.id));

      sqlite3_reset(st.get());
      sqlite3_clear_bindings(st.get());
    }
  } catch (const util::StoreError& e) {
    return Result::Err(e.Code(), e.what());
  }
  return Result::Ok();
}

Result SqliteRecordStore::InsertRecords(Transaction& t, const std::vector<model::TicketRecord>& records) {
  auto* db = TX(t).Handle();

  try {
    auto st = Prepare(db, sql::INSERT_TICKET);
    for (const auto& r : records) {
      if (r.id != 0) {
        BindI64(st.get(), 1, r.id);
      } else {
        sqlite3_bind_null(st.get(), 1);
      }
      BindText(st.get(), 2, r.token);

      int rc = sqlite3_step(st.get());
      if (rc != SQLITE_DONE) return Translate(db, rc);

      sqlite3_reset(st.get());
      sqlite3_clear_bindings(st.get());
    }
  } catch (const util::StoreError& e) {
    return Result::Err(e.Code(), e.what());
  }
  return Result::Ok();
}

Result SqliteRecordStore::DeleteAll(Transaction& t) {
  auto* db = TX(t).Handle();

  try {
    auto st = Prepare(db, sql::DELETE_TICKETS);
    return Translate(db, sqlite3_step(st.get()));
  } catch (const util::StoreError& e) {
    return Result::Err(e.Code(), e.what());
  }
}

} // namespace rowsweep::db::sqlite
