#pragma once
#include <string>
#include "sqlite3.h"
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 helpers.hpp — Value and row helpers
-------------------------------------------------------------------------------
These functions convert SQLite cells into Value objects and give values the
two relations the comparator needs:

  - value_equal / row_equal -> engine-native equality
  - value_to_string / row_to_string -> deterministic text, used as the sort
                                       key for order-insensitive comparison

Equality rules (same as SQLite's own affinity-free comparison of stored
values):
  - NULL equals NULL.
  - INTEGER and REAL compare numerically, so 1 == 1.0.
  - TEXT equals TEXT and BLOB equals BLOB byte for byte.
  - Anything else is unequal (TEXT '1' != INTEGER 1, TEXT 'a' != BLOB x'61').
-------------------------------------------------------------------------------
*/

// ==========================
// Conversion
// ==========================

/// Read column `col` of the current row of a stepped statement.
Value value_from_column(sqlite3_stmt* st, int col);

/// Read every column of the current row of a stepped statement.
Row row_from_statement(sqlite3_stmt* st);

// ==========================
// Equality
// ==========================

bool value_equal(const Value& a, const Value& b);

/// True if both rows have the same width and all cells are value_equal.
bool row_equal(const Row& a, const Row& b);

// ==========================
// Text representation
// ==========================

/// NULL, 42, 2.5, 'it''s', X'00FF'
std::string value_to_string(const Value& v);

/// (1, 'Movie', NULL)
std::string row_to_string(const Row& r);
