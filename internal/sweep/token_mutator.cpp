#include "internal/sweep/token_mutator.hpp"

#include "internal/util/uuid.hpp"

namespace rowsweep::sweep {

db::model::TicketRecord TokenMutator::Apply(db::model::TicketRecord record) const {
  record.token = NewToken();
  return record;
}

std::string TokenMutator::NewToken() {
  return util::ToString(util::GenerateUUID());
}

} // namespace rowsweep::sweep
