#pragma once

#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace cms::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  // Ordered maps keep listings in id order, matching the sqlite backend.
  struct State {
    std::map<uint64_t, model::TaskRecord> tasks;
    std::vector<model::TaskFileRecord> task_files;
    std::vector<model::TestcaseRecord> testcases;
    std::map<uint64_t, model::QuestionRecord> questions;
    std::map<uint64_t, model::SubmissionRecord> submissions;

    uint64_t next_task_id = 1;
    uint64_t next_question_id = 1;
    uint64_t next_submission_id = 1;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
