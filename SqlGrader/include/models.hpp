#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

/*
-------------------------------------------------------------------------------
 models.hpp — Core grading structs
-------------------------------------------------------------------------------
Defines plain data structures shared by every layer of the grader:
  - Value / Row / Rows   (one SQLite cell, one result tuple, a result set)
  - QueryResult          (outcome of running one piece of SQL)
  - ProblemConfig        (immutable definition of a problem)
  - ProblemError         (why a problem could not be set up)
  - AttemptResult        (outcome of grading one submission)

These are simple value types with public fields. None of them hold a
database handle; they can be copied freely and outlive any sandbox.
-------------------------------------------------------------------------------
*/

// Error kinds reported by the grader. Callers branch on these instead of
// matching message text.
enum class SqlError {
    None,
    Execution,            // engine failure: syntax, constraint, type, ...
    VerifyMultiStatement, // verification query held more than one statement
    Clone,                // reference database could not be copied
    Io,                   // dataset file could not be read
    InvalidName,          // dataset name rejected before touching the disk
};

// Storage class of a Value, mirrors SQLITE_NULL / INTEGER / FLOAT / TEXT / BLOB.
enum class ValueType {
    Null,
    Integer,
    Real,
    Text,
    Blob,
};

// One cell of a result row
struct Value {
    ValueType type{ ValueType::Null };
    std::int64_t integer{ 0 };
    double real{ 0.0 };
    std::string bytes;   // TEXT (UTF-8) or BLOB payload

    static Value null() { return Value{}; }
    static Value from_int(std::int64_t v) { Value x; x.type = ValueType::Integer; x.integer = v; return x; }
    static Value from_real(double v) { Value x; x.type = ValueType::Real; x.real = v; return x; }
    static Value from_text(std::string v) { Value x; x.type = ValueType::Text; x.bytes = std::move(v); return x; }
    static Value from_blob(std::string v) { Value x; x.type = ValueType::Blob; x.bytes = std::move(v); return x; }
};

using Row = std::vector<Value>;
using Rows = std::vector<Row>;

// Outcome of running one query. has_rows == false means the run failed;
// a successful query that produced nothing has has_rows == true and no rows.
struct QueryResult {
    bool has_rows{ false };
    Rows rows;
    SqlError error{ SqlError::None };
    std::string message;

    bool ok() const { return error == SqlError::None; }
};

// A problem definition. Empty verify_query / modification_query mean the
// step is not configured. The modification query only runs when a
// verification query is set.
struct ProblemConfig {
    std::string answer_query;
    std::string verify_query;
    std::string modification_query;
    bool is_ordered{ true };
};

// Why problem setup failed. stage is one of
// "dataset", "clone", "answer", "modification", "verify".
struct ProblemError {
    SqlError kind{ SqlError::None };
    std::string stage;
    std::string message;
};

// Outcome of one graded submission
struct AttemptResult {
    bool has_submission{ false };  // false when the submission chain failed
    Rows submission;
    Rows answer;
    SqlError error{ SqlError::None };
    std::string message;
    bool comparison{ false };
};

/// Human-readable name of an error kind, e.g. for log lines.
inline const char* sql_error_name(SqlError e) {
    switch (e) {
    case SqlError::None: return "none";
    case SqlError::Execution: return "execution";
    case SqlError::VerifyMultiStatement: return "verify-multi-statement";
    case SqlError::Clone: return "clone";
    case SqlError::Io: return "io";
    case SqlError::InvalidName: return "invalid-name";
    }
    return "unknown";
}
