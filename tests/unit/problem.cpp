#include "gtest/gtest.h"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "db.hpp"
#include "problem.hpp"

namespace {

const std::string kFixtures = SQLGRADER_FIXTURES_DIR;

ProblemConfig make_config(const std::string &answer, const std::string &verify = "",
                          const std::string &modification = "", bool is_ordered = true) {
  ProblemConfig config;
  config.answer_query = answer;
  config.verify_query = verify;
  config.modification_query = modification;
  config.is_ordered = is_ordered;
  return config;
}

}  // namespace

class GradingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::string error;
    ASSERT_TRUE(db_create_from_file(database_, kFixtures + "/rating.sql", error)) << error;
    ASSERT_TRUE(db_dump(database_, pristine_));
  }

  void TearDown() override {
    std::string now;
    EXPECT_TRUE(db_dump(database_, now));
    EXPECT_EQ(now, pristine_) << "grading modified the reference database";
    db_close(database_);
  }

  AttemptResult grade(const ProblemConfig &config, const std::string &query) {
    SqlProblem problem;
    ProblemError error;
    EXPECT_TRUE(problem_create(problem, database_, config, error)) << error.message;
    return problem.attempt(query);
  }

  sqlite3 *database_{nullptr};
  std::string pristine_;
};

TEST_F(GradingTest, SelectOrderMattersOnlyWhenOrdered) {
  const std::string answer = "SELECT * FROM Movie order by mID desc;";
  const std::string query = "SELECT * FROM Movie order by mID asc;";

  AttemptResult ordered = grade(make_config(answer, "", "", true), query);
  EXPECT_EQ(ordered.error, SqlError::None);
  EXPECT_FALSE(ordered.comparison);
  ASSERT_TRUE(ordered.has_submission);
  ASSERT_EQ(ordered.submission.size(), 8u);
  ASSERT_EQ(ordered.answer.size(), 8u);
  EXPECT_EQ(ordered.submission.front()[0].integer, 101);
  EXPECT_EQ(ordered.answer.front()[0].integer, 108);

  AttemptResult unordered = grade(make_config(answer, "", "", false), query);
  EXPECT_EQ(unordered.error, SqlError::None);
  EXPECT_TRUE(unordered.comparison);
}

TEST_F(GradingTest, DifferentRowsOrColumnsDoNotMatch) {
  const std::string answer = "SELECT * FROM Movie WHERE mID = 101";

  AttemptResult rows = grade(make_config(answer, "", "", false), "select * from Movie where mID=102");
  EXPECT_EQ(rows.error, SqlError::None);
  EXPECT_FALSE(rows.comparison);

  AttemptResult columns = grade(make_config(answer, "", "", false), "select mID from Movie where mID=101");
  EXPECT_EQ(columns.error, SqlError::None);
  EXPECT_FALSE(columns.comparison);

  AttemptResult same = grade(make_config(answer, "", "", false),
                             "SELECT mID, title, year, director FROM Movie WHERE title = 'Gone with the Wind'");
  EXPECT_TRUE(same.comparison);
}

TEST_F(GradingTest, UpdateCheckedThroughVerificationQuery) {
  const std::string verify = "SELECT * FROM Movie where mID = 1";
  const std::string answer = "insert into Movie values(1, 'Movie', 2000, 'Director')";
  const std::string query =
      "update Movie "
      "set mID=1, title='Movie', year=2000, director='Director' "
      "where mID=101";

  AttemptResult r = grade(make_config(answer, verify, "", false), query);
  EXPECT_EQ(r.error, SqlError::None);
  EXPECT_TRUE(r.comparison);
  ASSERT_TRUE(r.has_submission);
  EXPECT_EQ(r.submission.size(), 1u);
  EXPECT_EQ(r.answer.size(), 1u);
}

TEST_F(GradingTest, InvalidSubmissionReportsError) {
  AttemptResult r = grade(make_config("SELECT * FROM Movie"), "this is not sql");
  EXPECT_EQ(r.error, SqlError::Execution);
  EXPECT_FALSE(r.message.empty());
  EXPECT_FALSE(r.comparison);
  EXPECT_FALSE(r.has_submission);
  EXPECT_TRUE(r.submission.empty());
  EXPECT_EQ(r.answer.size(), 8u);
}

TEST_F(GradingTest, FailedSubmissionNeverMatchesEmptyAnswer) {
  AttemptResult r = grade(make_config("SELECT * FROM Movie WHERE mID = 1", "", "", false), "SELECT nope FROM");
  EXPECT_TRUE(r.answer.empty());
  EXPECT_EQ(r.error, SqlError::Execution);
  EXPECT_FALSE(r.comparison);
}

TEST_F(GradingTest, VerificationWithBrokenFirstStatementIsAMultiStatementError) {
  SqlProblem problem;
  ProblemError error;
  EXPECT_FALSE(problem_create(problem, database_,
                              make_config("SELECT 1", "SELECT * FROM nope; SELECT 1"), error));
  EXPECT_EQ(error.kind, SqlError::VerifyMultiStatement);
  EXPECT_EQ(error.stage, "verify");
}

TEST_F(GradingTest, EmptySuccessfulSubmissionMatchesEmptyAnswer) {
  SqlProblem problem;
  ProblemError error;
  ASSERT_TRUE(problem_create(problem, database_,
                             make_config("SELECT * FROM Movie WHERE mID = 1", "", "", false), error))
      << error.message;
  EXPECT_TRUE(problem.answer_result().empty());

  AttemptResult empty = problem.attempt("SELECT * FROM Movie WHERE mID = 2");
  EXPECT_TRUE(empty.has_submission);
  EXPECT_TRUE(empty.comparison);

  AttemptResult broken = problem.attempt("SELECT * FROM Movie WHERE");
  EXPECT_FALSE(broken.has_submission);
  EXPECT_FALSE(broken.comparison);
}

TEST_F(GradingTest, MultiStatementSubmissionRunsEveryStatement) {
  const std::string script =
      "UPDATE Movie SET mID = 1 WHERE mID = 101;"
      "INSERT INTO Movie VALUES(300, 'Up', 2009, 'Pete Docter');";
  const std::string verify = "SELECT mID, title FROM Movie WHERE mID IN (1, 101, 300) ORDER BY mID";

  AttemptResult both = grade(make_config(script, verify), script);
  EXPECT_EQ(both.error, SqlError::None);
  EXPECT_TRUE(both.comparison);
  ASSERT_EQ(both.submission.size(), 2u);
  EXPECT_EQ(both.submission[0][0].integer, 1);
  EXPECT_EQ(both.submission[1][0].integer, 300);

  AttemptResult update_only = grade(make_config(script, verify), "UPDATE Movie SET mID = 1 WHERE mID = 101");
  EXPECT_EQ(update_only.error, SqlError::None);
  EXPECT_FALSE(update_only.comparison);
  EXPECT_EQ(update_only.submission.size(), 1u);
}

TEST_F(GradingTest, ScriptWithoutVerificationYieldsNoRows) {
  AttemptResult r = grade(make_config("SELECT * FROM Movie WHERE mID = 1"),
                          "DELETE FROM Rating; INSERT INTO Movie VALUES(1, 'a', 1, 'b');");
  EXPECT_EQ(r.error, SqlError::None);
  ASSERT_TRUE(r.has_submission);
  EXPECT_TRUE(r.submission.empty());
  EXPECT_TRUE(r.comparison);
}

TEST_F(GradingTest, ModificationRunsBetweenSubmissionAndVerification) {
  ProblemConfig config = make_config("UPDATE Movie SET year = 2001 WHERE mID = 101",
                                     "SELECT mID FROM Movie ORDER BY mID",
                                     "DELETE FROM Movie WHERE year < 1950");
  SqlProblem problem;
  ProblemError error;
  ASSERT_TRUE(problem_create(problem, database_, config, error)) << error.message;
  EXPECT_EQ(problem.answer_result().size(), 7u);

  AttemptResult right = problem.attempt("UPDATE Movie SET year = 2001 WHERE title = 'Gone with the Wind'");
  EXPECT_TRUE(right.comparison);

  AttemptResult wrong = problem.attempt("SELECT 1");
  EXPECT_EQ(wrong.error, SqlError::None);
  EXPECT_EQ(wrong.submission.size(), 6u);
  EXPECT_FALSE(wrong.comparison);
}

TEST_F(GradingTest, ModificationFailureIsAnAttemptError) {
  ProblemConfig config = make_config("SELECT 1", "SELECT COUNT(*) FROM Rating",
                                     "DELETE FROM Rating WHERE stars < 3");
  SqlProblem problem;
  ProblemError error;
  ASSERT_TRUE(problem_create(problem, database_, config, error)) << error.message;

  AttemptResult r = problem.attempt("DROP TABLE Rating");
  EXPECT_EQ(r.error, SqlError::Execution);
  EXPECT_FALSE(r.has_submission);
  EXPECT_FALSE(r.comparison);

  // the problem survives a broken attempt
  AttemptResult ok = problem.attempt("SELECT 2");
  EXPECT_EQ(ok.error, SqlError::None);
  EXPECT_TRUE(ok.comparison);
}

TEST_F(GradingTest, MultiStatementVerificationIsAConfigurationError) {
  SqlProblem problem;
  ProblemError error;
  EXPECT_FALSE(problem_create(problem, database_,
                              make_config("SELECT 1", "SELECT * FROM Movie; SELECT 1"), error));
  EXPECT_EQ(error.kind, SqlError::VerifyMultiStatement);
  EXPECT_EQ(error.stage, "verify");
  EXPECT_FALSE(problem.ready());
}

TEST_F(GradingTest, BrokenAnswerIsAConfigurationError) {
  SqlProblem problem;
  ProblemError error;
  EXPECT_FALSE(problem_create(problem, database_, make_config("SELEC * FROM Movie"), error));
  EXPECT_EQ(error.kind, SqlError::Execution);
  EXPECT_EQ(error.stage, "answer");
  EXPECT_FALSE(error.message.empty());

  EXPECT_FALSE(problem_create(problem, database_,
                              make_config("SELECT 1", "SELECT 1", "DELETE FROM Nope"), error));
  EXPECT_EQ(error.kind, SqlError::Execution);
  EXPECT_EQ(error.stage, "modification");
}

TEST_F(GradingTest, ModificationIgnoredWithoutVerification) {
  AttemptResult r = grade(make_config("SELECT COUNT(*) FROM Movie", "", "DELETE FROM Nope"),
                          "SELECT 8");
  EXPECT_EQ(r.error, SqlError::None);
  EXPECT_TRUE(r.comparison);
}

TEST_F(GradingTest, ConcurrentAttemptsShareTheReference) {
  SqlProblem problem;
  ProblemError error;
  ASSERT_TRUE(problem_create(problem, database_,
                             make_config("DELETE FROM Movie WHERE mID > 105",
                                         "SELECT COUNT(*) FROM Movie"),
                             error))
      << error.message;

  std::atomic<int> correct{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&] {
      for (int i = 0; i < 10; ++i) {
        if (problem.attempt("DELETE FROM Movie WHERE mID >= 106").comparison) ++correct;
      }
    });
  }
  for (auto &w : workers) w.join();
  EXPECT_EQ(correct.load(), 40);
}

TEST(ProblemFromDataset, LoadsNamedDataset) {
  SqlProblem problem;
  ProblemError error;
  ASSERT_TRUE(problem_create_from_dataset(problem, kFixtures, "rating",
                                          make_config("SELECT name FROM Reviewer ORDER BY rID"), error))
      << error.message;
  EXPECT_TRUE(problem.ready());
  EXPECT_NE(problem.database(), nullptr);
  EXPECT_EQ(problem.answer_result().size(), 8u);

  AttemptResult r = problem.attempt("SELECT name FROM Reviewer ORDER BY rID ASC");
  EXPECT_TRUE(r.comparison);
}

TEST(ProblemFromDataset, RejectsUnknownOrUnsafeNames) {
  SqlProblem problem;
  ProblemError error;
  EXPECT_FALSE(problem_create_from_dataset(problem, kFixtures, "../fixtures/rating",
                                           make_config("SELECT 1"), error));
  EXPECT_EQ(error.kind, SqlError::InvalidName);
  EXPECT_EQ(error.stage, "dataset");

  EXPECT_FALSE(problem_create_from_dataset(problem, kFixtures, "missing",
                                           make_config("SELECT 1"), error));
  EXPECT_EQ(error.kind, SqlError::Io);
  EXPECT_FALSE(problem.ready());
}

TEST(ProblemNotReady, AttemptReportsCloneError) {
  SqlProblem problem;
  AttemptResult r = problem.attempt("SELECT 1");
  EXPECT_EQ(r.error, SqlError::Clone);
  EXPECT_FALSE(r.comparison);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
