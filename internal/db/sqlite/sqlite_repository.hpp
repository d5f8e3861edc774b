#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace cms::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTask(Transaction&, model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, uint64_t) override;
  Result SetTaskStatement(Transaction&, uint64_t, const std::string&) override;
  Result InsertTaskFile(Transaction&, const model::TaskFileRecord&) override;
  std::vector<model::TaskFileRecord> ListTaskFiles(Transaction&, uint64_t, model::TaskFileKind) override;

  uint32_t CountTestcases(Transaction&, uint64_t) override;
  Result InsertTestcase(Transaction&, const model::TestcaseRecord&) override;
  std::vector<model::TestcaseRecord> ListTestcases(Transaction&, uint64_t) override;

  Result InsertQuestion(Transaction&, model::QuestionRecord&) override;
  std::vector<model::QuestionRecord> ListUnansweredQuestions(Transaction&, int64_t) override;
  uint64_t CountUnansweredQuestions(Transaction&) override;

  Result InsertSubmission(Transaction&, model::SubmissionRecord&) override;
  std::optional<model::SubmissionRecord> GetSubmission(Transaction&, uint64_t) override;
  std::vector<model::SubmissionRecord> ListSubmissionsByTask(Transaction&, uint64_t) override;
  std::vector<model::SubmissionRecord> ListSubmissionsByUser(Transaction&, uint64_t) override;
  Result InvalidateSubmission(Transaction&, uint64_t) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
