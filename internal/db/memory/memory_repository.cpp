#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace cms::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result MemoryRepository::InsertTask(Transaction& t, model::TaskRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_task_id++;
  s.tasks[r.id] = r;
  return Result::Ok();
}

std::optional<model::TaskRecord> MemoryRepository::GetTask(Transaction& t, uint64_t task_id) {
  const auto& s  = TX(t).View();
  auto        it = s.tasks.find(task_id);
  if (it == s.tasks.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::SetTaskStatement(Transaction& t, uint64_t task_id, const std::string& digest) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tasks.find(task_id);
  if (it == s.tasks.end()) return Result::Err(ErrorCode::NotFound, "task " + std::to_string(task_id));
  it->second.statement_digest = digest;
  return Result::Ok();
}

Result MemoryRepository::InsertTaskFile(Transaction& t, const model::TaskFileRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.tasks.contains(r.task_id)) return Result::Err(ErrorCode::ConstraintViolation, "task " + std::to_string(r.task_id));
  s.task_files.push_back(r);
  return Result::Ok();
}

std::vector<model::TaskFileRecord> MemoryRepository::ListTaskFiles(Transaction& t, uint64_t task_id, model::TaskFileKind kind) {
  const auto&                        s = TX(t).View();
  std::vector<model::TaskFileRecord> out;
  std::copy_if(s.task_files.begin(), s.task_files.end(), std::back_inserter(out),
               [&](const model::TaskFileRecord& r) { return r.task_id == task_id && r.kind == kind; });
  return out;
}

// ------------------------------------------------------------------
// Testcases
// ------------------------------------------------------------------

uint32_t MemoryRepository::CountTestcases(Transaction& t, uint64_t task_id) {
  const auto& s = TX(t).View();
  return static_cast<uint32_t>(std::count_if(s.testcases.begin(), s.testcases.end(),
                                             [&](const model::TestcaseRecord& r) { return r.task_id == task_id; }));
}

Result MemoryRepository::InsertTestcase(Transaction& t, const model::TestcaseRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.tasks.contains(r.task_id)) return Result::Err(ErrorCode::ConstraintViolation, "task " + std::to_string(r.task_id));
  const bool taken = std::any_of(s.testcases.begin(), s.testcases.end(),
                                 [&](const model::TestcaseRecord& e) { return e.task_id == r.task_id && e.num == r.num; });
  if (taken) return Result::Err(ErrorCode::AlreadyExists, "testcase " + std::to_string(r.num));
  s.testcases.push_back(r);
  return Result::Ok();
}

std::vector<model::TestcaseRecord> MemoryRepository::ListTestcases(Transaction& t, uint64_t task_id) {
  const auto&                        s = TX(t).View();
  std::vector<model::TestcaseRecord> out;
  std::copy_if(s.testcases.begin(), s.testcases.end(), std::back_inserter(out),
               [&](const model::TestcaseRecord& r) { return r.task_id == task_id; });
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.num < b.num; });
  return out;
}

// ------------------------------------------------------------------
// Questions
// ------------------------------------------------------------------

Result MemoryRepository::InsertQuestion(Transaction& t, model::QuestionRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_question_id++;
  s.questions[r.id] = r;
  return Result::Ok();
}

std::vector<model::QuestionRecord> MemoryRepository::ListUnansweredQuestions(Transaction& t, int64_t since) {
  const auto&                        s = TX(t).View();
  std::vector<model::QuestionRecord> out;
  for (const auto& [_, q] : s.questions) {
    if (!q.reply_timestamp && q.question_timestamp > since) out.push_back(q);
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const auto& a, const auto& b) { return a.question_timestamp < b.question_timestamp; });
  return out;
}

uint64_t MemoryRepository::CountUnansweredQuestions(Transaction& t) {
  const auto& s = TX(t).View();
  return static_cast<uint64_t>(
      std::count_if(s.questions.begin(), s.questions.end(), [](const auto& entry) { return !entry.second.reply_timestamp; }));
}

// ------------------------------------------------------------------
// Submissions
// ------------------------------------------------------------------

Result MemoryRepository::InsertSubmission(Transaction& t, model::SubmissionRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_submission_id++;
  s.submissions[r.id] = r;
  return Result::Ok();
}

std::optional<model::SubmissionRecord> MemoryRepository::GetSubmission(Transaction& t, uint64_t submission_id) {
  const auto& s  = TX(t).View();
  auto        it = s.submissions.find(submission_id);
  if (it == s.submissions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SubmissionRecord> MemoryRepository::ListSubmissionsByTask(Transaction& t, uint64_t task_id) {
  std::vector<model::SubmissionRecord> out;
  for (const auto& [_, r] : TX(t).View().submissions) {
    if (r.task_id == task_id) out.push_back(r);
  }
  return out;
}

std::vector<model::SubmissionRecord> MemoryRepository::ListSubmissionsByUser(Transaction& t, uint64_t user_id) {
  std::vector<model::SubmissionRecord> out;
  for (const auto& [_, r] : TX(t).View().submissions) {
    if (r.user_id == user_id) out.push_back(r);
  }
  return out;
}

Result MemoryRepository::InvalidateSubmission(Transaction& t, uint64_t submission_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.submissions.find(submission_id);
  if (it == s.submissions.end()) return Result::Err(ErrorCode::NotFound, "submission " + std::to_string(submission_id));
  it->second.invalidated = true;
  return Result::Ok();
}

} // namespace cms::db::memory
