#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/question_record.hpp"
#include "internal/db/model/submission_record.hpp"
#include "internal/db/model/task_file_record.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/db/model/testcase_record.hpp"

namespace cms::db {

/*
  Repository abstraction.

  Covers only what the admin core persists or reads back:

  - the aggregated result of a completed upload session (statement,
    attachment, manager, testcase)
  - unanswered questions folded into notification polls
  - submissions invalidated for reevaluation

  All access goes through a Transaction; an upload session's success
  action commits its rows in exactly one transaction.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Tasks and task files
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertTask(Transaction&, model::TaskRecord&) = 0;

  virtual std::optional<model::TaskRecord> GetTask(Transaction&, uint64_t task_id) = 0;

  virtual Result SetTaskStatement(Transaction&, uint64_t task_id, const std::string& digest) = 0;

  virtual Result InsertTaskFile(Transaction&, const model::TaskFileRecord&) = 0;

  virtual std::vector<model::TaskFileRecord> ListTaskFiles(Transaction&, uint64_t task_id, model::TaskFileKind kind) = 0;

  // ---------------------------------------------------------------------
  // Testcases
  // ---------------------------------------------------------------------

  virtual uint32_t CountTestcases(Transaction&, uint64_t task_id) = 0;

  virtual Result InsertTestcase(Transaction&, const model::TestcaseRecord&) = 0;

  virtual std::vector<model::TestcaseRecord> ListTestcases(Transaction&, uint64_t task_id) = 0;

  // ---------------------------------------------------------------------
  // Questions
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertQuestion(Transaction&, model::QuestionRecord&) = 0;

  // Unanswered questions asked strictly after `since`, oldest first.
  virtual std::vector<model::QuestionRecord> ListUnansweredQuestions(Transaction&, int64_t since) = 0;

  virtual uint64_t CountUnansweredQuestions(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Submissions
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertSubmission(Transaction&, model::SubmissionRecord&) = 0;

  virtual std::optional<model::SubmissionRecord> GetSubmission(Transaction&, uint64_t submission_id) = 0;

  virtual std::vector<model::SubmissionRecord> ListSubmissionsByTask(Transaction&, uint64_t task_id) = 0;

  virtual std::vector<model::SubmissionRecord> ListSubmissionsByUser(Transaction&, uint64_t user_id) = 0;

  virtual Result InvalidateSubmission(Transaction&, uint64_t submission_id) = 0;
};

} // namespace cms::db
