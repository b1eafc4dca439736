#pragma once

#include <string>

#include "internal/db/model/ticket_record.hpp"

namespace rowsweep::sweep {

/*
  Replaces a ticket's token with a fresh random UUIDv4.

  Depends only on its input; applying it twice to the same row yields
  two different, equally valid tokens.
*/
class TokenMutator {
 public:
  db::model::TicketRecord Apply(db::model::TicketRecord record) const;

  static std::string NewToken();
};

} // namespace rowsweep::sweep
