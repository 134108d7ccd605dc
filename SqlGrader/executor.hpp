#pragma once
#include <string>
#include "sqlite3.h"
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 executor.hpp — Running one query against a database
-------------------------------------------------------------------------------

SQLite offers two ways to run SQL text and neither fits every query:
  - sqlite3_prepare_v2 / sqlite3_step returns rows but only compiles the first
    statement of the text.
  - sqlite3_exec runs every statement but throws SELECT rows away.

run_query picks one with an explicit two-step policy:

  1. Prepare the first statement. If nothing but whitespace, comments or ';'
     is left over, step it and collect every row.
  2. Otherwise the text is a script:
       allow_multi_statement == false -> SqlError::VerifyMultiStatement,
                                         nothing is executed
       allow_multi_statement == true  -> run it with sqlite3_exec, no rows

A verification query whose first statement does not compile is still checked
for a second statement; if it has one the result is VerifyMultiStatement.
Any other engine error gives SqlError::Execution with the engine message and
has_rows == false.
-------------------------------------------------------------------------------
*/

/// Message carried by SqlError::VerifyMultiStatement results.
extern const char* const kVerifyMultiStatementMessage;

/// Run `sql` on `db`. See the policy above.
QueryResult run_query(sqlite3* db, const std::string& sql, bool allow_multi_statement);
