#include "problem.hpp"
#include "compare.hpp"
#include "datasets.hpp"
#include "db.hpp"
#include "executor.hpp"
#include "validation.hpp"
#include <iostream>

// Empty or whitespace-only optional queries count as "not set".
static bool is_set(const std::string& query) {
    return !trim(query).empty();
}

// Run the evaluation chain on a fresh sandbox of `reference`.
// `stage` names the step that produced the result (or the failure).
static QueryResult run_chain(sqlite3* reference, const std::string& query,
    const ProblemConfig& config, std::string& stage) {
    sqlite3* sandbox = nullptr;
    std::string error;
    stage = "clone";
    if (!db_clone(reference, sandbox, error)) {
        QueryResult r;
        r.error = SqlError::Clone;
        r.message = error;
        return r;
    }

    stage = "query";
    QueryResult result = run_query(sandbox, query, true);
    if (result.ok() && is_set(config.verify_query)) {
        if (is_set(config.modification_query)) {
            stage = "modification";
            result = run_query(sandbox, config.modification_query, true);
        }
        if (result.ok()) {
            stage = "verify";
            result = run_query(sandbox, config.verify_query, false);
        }
    }

    db_close(sandbox);
    return result;
}

SqlProblem::~SqlProblem() {
    reset();
}

void SqlProblem::reset() {
    if (owns_database_) db_close(database_);
    database_ = nullptr;
    owns_database_ = false;
    ready_ = false;
    config_ = ProblemConfig{};
    answer_ = QueryResult{};
}

AttemptResult SqlProblem::attempt(const std::string& query) const {
    AttemptResult out;
    out.answer = answer_.rows;

    std::string stage;
    QueryResult submission = run_chain(database_, query, config_, stage);
    if (!submission.ok()) {
        // A failed chain never matches, whatever the answer looks like.
        out.has_submission = false;
        out.error = submission.error;
        out.message = submission.message;
        out.comparison = false;
        return out;
    }

    out.has_submission = true;
    out.comparison = compare_results(answer_, submission, config_.is_ordered);
    out.submission = std::move(submission.rows);
    return out;
}

bool problem_create(SqlProblem& problem, sqlite3* reference,
    const ProblemConfig& config, ProblemError& error) {
    problem.reset();
    error = ProblemError{};

    std::string stage;
    QueryResult answer = run_chain(reference, config.answer_query, config, stage);
    if (!answer.ok()) {
        error.kind = answer.error;
        error.stage = (stage == "query") ? "answer" : stage;
        error.message = answer.message;
        std::cerr << "Problem configuration error (" << error.stage << ", "
                  << sql_error_name(error.kind) << "): " << error.message << "\n";
        return false;
    }

    problem.database_ = reference;
    problem.config_ = config;
    problem.answer_ = std::move(answer);
    problem.ready_ = true;
    return true;
}

bool problem_create_from_dataset(SqlProblem& problem,
    const std::string& dataset_dir, const std::string& dataset_name,
    const ProblemConfig& config, ProblemError& error) {
    problem.reset();
    error = ProblemError{};

    sqlite3* db = nullptr;
    SqlError kind = SqlError::None;
    std::string message;
    if (!db_create_dataset(db, dataset_dir, dataset_name, kind, message)) {
        error.kind = kind;
        error.stage = "dataset";
        error.message = message;
        std::cerr << "Problem configuration error (dataset, "
                  << sql_error_name(kind) << "): " << message << "\n";
        return false;
    }

    if (!problem_create(problem, db, config, error)) {
        db_close(db);
        return false;
    }
    problem.owns_database_ = true;
    return true;
}
