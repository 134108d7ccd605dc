#pragma once
#include <string>
#include "sqlite3.h"
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 problem.hpp — A gradable SQL problem
-------------------------------------------------------------------------------

An SqlProblem binds a ProblemConfig to a reference database and caches the
answer result. Grading a submission never touches the reference database:
every evaluation runs on its own clone (db_clone) which is closed before the
call returns.

Evaluation chain (same for the answer and for every submission):
  1. clone the reference database into a sandbox
  2. run the query (several statements allowed)
  3. if a verification query is set:
       3a. run the modification query, if set (several statements allowed)
       3b. run the verification query (one statement only)
  4. the rows of the last step are the result

Lifecycle:
  - problem_create / problem_create_from_dataset compute the answer once.
    They return false when the problem itself is broken; that is an
    authoring error, reported through ProblemError, never a wrong answer.
  - attempt() may then be called any number of times, from any thread.
  - A problem built from a dataset owns its reference database and closes it
    on destruction. A problem built from a handle borrows it; the caller
    keeps it open for the lifetime of the problem.
-------------------------------------------------------------------------------
*/

class SqlProblem {
public:
    SqlProblem() = default;
    ~SqlProblem();

    SqlProblem(const SqlProblem&) = delete;
    SqlProblem& operator=(const SqlProblem&) = delete;

    /// Grade one submission against the cached answer.
    AttemptResult attempt(const std::string& query) const;

    bool ready() const { return ready_; }
    const ProblemConfig& config() const { return config_; }
    const Rows& answer_result() const { return answer_.rows; }
    sqlite3* database() const { return database_; }

private:
    void reset();

    friend bool problem_create(SqlProblem& problem, sqlite3* reference,
        const ProblemConfig& config, ProblemError& error);
    friend bool problem_create_from_dataset(SqlProblem& problem,
        const std::string& dataset_dir, const std::string& dataset_name,
        const ProblemConfig& config, ProblemError& error);

    sqlite3* database_{ nullptr };
    bool owns_database_{ false };
    bool ready_{ false };
    ProblemConfig config_;
    QueryResult answer_;
};

/// Set up `problem` on a borrowed reference database.
/// Returns false and fills `error` if the answer chain cannot run.
bool problem_create(SqlProblem& problem, sqlite3* reference,
    const ProblemConfig& config, ProblemError& error);

/// Set up `problem` on dataset `dataset_name` from `dataset_dir`
/// (see datasets.hpp). The problem owns the database it loads.
bool problem_create_from_dataset(SqlProblem& problem,
    const std::string& dataset_dir, const std::string& dataset_name,
    const ProblemConfig& config, ProblemError& error);
