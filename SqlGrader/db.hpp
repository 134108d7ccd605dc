#pragma once
#include <string>
#include "sqlite3.h"
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 db.hpp — Public interface to the SQLite layer
-------------------------------------------------------------------------------

This header declares the functions that create, copy and tear down the
in-memory databases the grader works on. Higher-level code (executor,
problem) never opens a connection by itself.

Design:
  - Each function returns `bool` to indicate success/failure. Functions that
    can fail for a reason the caller must report take a `std::string& error`.
  - Every database is a private ":memory:" database in serialized threading
    mode, so a reference handle can be read from several threads.
  - Foreign-key enforcement is left at SQLite's default (off).

Usage convention:
  - Build a reference database once with `db_create_from_sql` or
    `db_create_from_file`.
  - Call `db_clone` for every evaluation, run queries on the clone, then
    `db_close` it before returning.
-------------------------------------------------------------------------------
*/

/// Opens a new, empty in-memory database.
/// Returns true on success, false on failure. On failure, `db` is set to nullptr.
bool db_open_memory(sqlite3*& db);

/// Close DB (safe if db==nullptr).
void db_close(sqlite3* db);

/// Run `sql` (any number of statements) with sqlite3_exec. Rows produced by
/// SELECT statements are discarded. On failure `error` holds the engine message.
bool db_exec(sqlite3* db, const std::string& sql, std::string& error);

// ==========================
// Reference databases
// ==========================

/// New in-memory database initialized by running `script`.
/// On failure `db` is nullptr and `error` holds the engine message.
bool db_create_from_sql(sqlite3*& db, const std::string& script, std::string& error);

/// Read a whole file into `out`. Returns false if it cannot be opened or read.
bool read_text_file(const std::string& path, std::string& out);

/// Same as db_create_from_sql, reading the script from the file at `path`.
bool db_create_from_file(sqlite3*& db, const std::string& path, std::string& error);

// ==========================
// Cloning
// ==========================

/// Serialize schema and data into a SQL script that rebuilds the database.
/// Output order is deterministic: the same content always dumps the same text.
bool db_dump(sqlite3* db, std::string& out);

/// Copy `source` into a brand-new in-memory database by replaying its dump.
/// `source` is only read. On failure `out` is nullptr.
bool db_clone(sqlite3* source, sqlite3*& out, std::string& error);
