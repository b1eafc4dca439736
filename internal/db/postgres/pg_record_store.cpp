#include "pg_record_store.hpp"

#include "internal/db/postgres/pg_error.hpp"

namespace rowsweep::db::postgres {

namespace {

std::vector<model::TicketRecord> ToTickets(const pqxx::result& res) {
  std::vector<model::TicketRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::TicketRecord r;
    r.id    = row[0].as<std::int64_t>();
    r.token = row[1].c_str();
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace

PgRecordStore::PgRecordStore(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRecordStore::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRecordStore::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRecordStore::Translate(const std::exception& e) {
  return Result::Err(TranslateCode(e), e.what());
}

void PgRecordStore::BootstrapSchema() {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    tx.exec("CREATE TABLE IF NOT EXISTS ticket (id BIGSERIAL PRIMARY KEY, token TEXT NOT NULL);");
    tx.exec("SELECT id,token FROM ticket LIMIT 1;");
    tx.commit();
  } catch (const std::exception& e) {
    throw ToStoreError(e);
  }
}

std::uint64_t PgRecordStore::CountRecords(Transaction& t) {
  try {
    auto res = TX(t).Work().exec_prepared("count_tickets");
    return res[0][0].as<std::uint64_t>();
  } catch (const std::exception& e) {
    throw ToStoreError(e);
  }
}

std::vector<model::TicketRecord> PgRecordStore::FetchByOffset(Transaction& t, std::uint64_t offset,
                                                              std::uint64_t limit) {
  try {
    return ToTickets(TX(t).Work().exec_prepared("select_tickets_by_offset", limit, offset));
  } catch (const std::exception& e) {
    throw ToStoreError(e);
  }
}

std::vector<model::TicketRecord> PgRecordStore::FetchAfter(Transaction& t, std::optional<std::int64_t> after_id,
                                                           std::uint64_t limit) {
  try {
    if (!after_id) return ToTickets(TX(t).Work().exec_prepared("select_tickets_first", limit));
    return ToTickets(TX(t).Work().exec_prepared("select_tickets_after", *after_id, limit));
  } catch (const std::exception& e) {
    throw ToStoreError(e);
  }
}

std::optional<std::int64_t> PgRecordStore::KeyAtOffset(Transaction& t, std::uint64_t offset) {
  try {
    auto res = TX(t).Work().exec_prepared("select_ticket_key_at", offset);
    if (res.empty()) return std::nullopt;
    return res[0][0].as<std::int64_t>();
  } catch (const std::exception& e) {
    throw ToStoreError(e);
  }
}

Result PgRecordStore::UpdateTokens(Transaction& t, const std::vector<model::TicketRecord>& records) {
  try {
    auto& work = TX(t).Work();
    for (const auto& r : records) {
      auto res = work.exec_prepared("update_ticket_token", r.id, r.token);
      if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "ticket " + std::to_string(r.id));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRecordStore::InsertRecords(Transaction& t, const std::vector<model::TicketRecord>& records) {
  try {
    auto& work = TX(t).Work();
    for (const auto& r : records) {
      if (r.id != 0) {
        work.exec_prepared("insert_ticket_with_id", r.id, r.token);
      } else {
        work.exec_prepared("insert_ticket", r.token);
      }
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRecordStore::DeleteAll(Transaction& t) {
  try {
    TX(t).Work().exec("DELETE FROM ticket;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace rowsweep::db::postgres
