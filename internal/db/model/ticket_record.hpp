#pragma once

#include <cstdint>
#include <string>

namespace rowsweep::db::model {

/*
  Persistent ticket row.

  IMPORTANT:
  - id is the sort key and never changes during a sweep.
  - token is the only mutated column (canonical UUID text).
  - id == 0 on insert means "let the backend assign it".
*/

struct TicketRecord {
  std::int64_t id = 0;
  std::string  token;
};

}
