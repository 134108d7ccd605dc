#include "executor.hpp"
#include "db.hpp"
#include "helpers.hpp"
#include "validation.hpp"

const char* const kVerifyMultiStatementMessage =
    "Verification query should not contain multiple statements. "
    "Check problem configuration.";

static QueryResult failed(SqlError kind, std::string message) {
    QueryResult r;
    r.has_rows = false;
    r.error = kind;
    r.message = std::move(message);
    return r;
}

// Step 2: the text holds more than one statement.
static QueryResult run_script(sqlite3* db, const std::string& sql, bool allow_multi_statement) {
    if (!allow_multi_statement)
        return failed(SqlError::VerifyMultiStatement, kVerifyMultiStatementMessage);

    std::string error;
    if (!db_exec(db, sql, error))
        return failed(SqlError::Execution, error);

    QueryResult r;
    r.has_rows = true;   // a script succeeds with an empty row set
    return r;
}

// True if `sql` holds a complete statement followed by another one. Used when
// the first statement does not compile, so the prepare tail is unavailable.
// sqlite3_complete keeps ';' inside strings, comments and trigger bodies from
// counting as a boundary.
static bool has_second_statement(const std::string& sql) {
    for (size_t pos = sql.find(';'); pos != std::string::npos; pos = sql.find(';', pos + 1)) {
        std::string head = sql.substr(0, pos + 1);
        if (sqlite3_complete(head.c_str()))
            return !sql_tail_is_empty(sql.c_str() + pos + 1);
    }
    return false;
}

QueryResult run_query(sqlite3* db, const std::string& sql, bool allow_multi_statement) {
    // Step 1: compile only the first statement and look at what is left.
    sqlite3_stmt* st = nullptr;
    const char* tail = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, &tail) != SQLITE_OK) {
        std::string message = sqlite3_errmsg(db);
        sqlite3_finalize(st);
        if (!allow_multi_statement && has_second_statement(sql))
            return failed(SqlError::VerifyMultiStatement, kVerifyMultiStatementMessage);
        return failed(SqlError::Execution, message);
    }

    if (!sql_tail_is_empty(tail)) {
        sqlite3_finalize(st);
        return run_script(db, sql, allow_multi_statement);
    }

    QueryResult r;
    r.has_rows = true;
    if (!st) return r;   // empty or comment-only text

    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW)
        r.rows.push_back(row_from_statement(st));

    if (rc != SQLITE_DONE) {
        std::string message = sqlite3_errmsg(db);
        sqlite3_finalize(st);
        return failed(SqlError::Execution, message);
    }
    sqlite3_finalize(st);
    return r;
}
