#pragma once
#include <string>
#include <vector>
#include "sqlite3.h"
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 datasets.hpp — Named dataset scripts on disk
-------------------------------------------------------------------------------
A dataset is a file "<name>.sql" in a dataset directory. The script creates
the schema and inserts the seed rows of one reference database.
-------------------------------------------------------------------------------
*/

/// Names of every "*.sql" file directly inside `dir`, extension stripped,
/// sorted. Returns an empty list if `dir` does not exist.
std::vector<std::string> list_datasets(const std::string& dir);

/// Load dataset `name` from `dir` into a new in-memory database.
/// On failure `db` is nullptr, `kind` is InvalidName, Io or Execution and
/// `error` holds the reason.
bool db_create_dataset(sqlite3*& db, const std::string& dir, const std::string& name,
    SqlError& kind, std::string& error);
