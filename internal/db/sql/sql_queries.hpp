#pragma once

namespace rowsweep::db::sql {

/*
  Canonical SQL for the ticket table (SQLite dialect).

  IMPORTANT:
  Every read orders by id; page boundaries depend on it.
*/

static constexpr const char* CREATE_TICKET_TABLE =
    "CREATE TABLE IF NOT EXISTS ticket (id INTEGER PRIMARY KEY, token TEXT NOT NULL);";

static constexpr const char* COUNT_TICKETS =
    "SELECT COUNT(*) FROM ticket;";

static constexpr const char* SELECT_TICKETS_BY_OFFSET =
    "SELECT id,token FROM ticket ORDER BY id LIMIT ? OFFSET ?;";

static constexpr const char* SELECT_TICKETS_FIRST =
    "SELECT id,token FROM ticket ORDER BY id LIMIT ?;";

static constexpr const char* SELECT_TICKETS_AFTER =
    "SELECT id,token FROM ticket WHERE id > ? ORDER BY id LIMIT ?;";

static constexpr const char* SELECT_TICKET_KEY_AT =
    "SELECT id FROM ticket ORDER BY id LIMIT 1 OFFSET ?;";

static constexpr const char* UPDATE_TICKET_TOKEN =
    "UPDATE ticket SET token=? WHERE id=?;";

// NULL id lets SQLite assign the rowid
static constexpr const char* INSERT_TICKET =
    "INSERT INTO ticket(id,token) VALUES(?,?);";

static constexpr const char* DELETE_TICKETS =
    "DELETE FROM ticket;";

}
