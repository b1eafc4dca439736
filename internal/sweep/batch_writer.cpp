#include "internal/sweep/batch_writer.hpp"

#include "internal/util/errors.hpp"

namespace rowsweep::sweep {

BatchWriter::BatchWriter(db::RecordStore& store) : store_(store) {
}

db::Result BatchWriter::Commit(db::Transaction& tx, const std::vector<db::model::TicketRecord>& records) {
  auto result = store_.UpdateTokens(tx, records);
  if (!result) {
    return result;
  }

  try {
    tx.Commit();
  } catch (const util::StoreError& e) {
    return db::Result::Err(e.Code(), std::string("commit: ") + e.what());
  }
  return db::Result::Ok();
}

} // namespace rowsweep::sweep
