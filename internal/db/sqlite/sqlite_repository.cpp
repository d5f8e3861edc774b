#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace cms::db::sqlite {

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& Text(int idx, const std::string& s) {
    sqlite3_bind_text(st_, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
    return *this;
  }
  Statement& I64(int idx, int64_t v) {
    sqlite3_bind_int64(st_, idx, static_cast<sqlite3_int64>(v));
    return *this;
  }
  Statement& U64(int idx, uint64_t v) {
    return I64(idx, static_cast<int64_t>(v));
  }
  Statement& Null(int idx) {
    sqlite3_bind_null(st_, idx);
    return *this;
  }

  int Step() {
    return sqlite3_step(st_);
  }

  std::string ColText(int col) const {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st_, col)) : std::string{};
  }
  int64_t ColI64(int col) const {
    return sqlite3_column_int64(st_, col);
  }
  uint64_t ColU64(int col) const {
    return static_cast<uint64_t>(ColI64(col));
  }
  bool ColNull(int col) const {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

model::QuestionRecord ReadQuestion(const Statement& st) {
  model::QuestionRecord q;
  q.id                 = st.ColU64(0);
  q.contest_id         = st.ColU64(1);
  q.user               = st.ColText(2);
  q.question_timestamp = st.ColI64(3);
  if (!st.ColNull(4)) q.reply_timestamp = st.ColI64(4);
  q.subject = st.ColText(5);
  q.text    = st.ColText(6);
  return q;
}

model::SubmissionRecord ReadSubmission(const Statement& st) {
  model::SubmissionRecord r;
  r.id          = st.ColU64(0);
  r.task_id     = st.ColU64(1);
  r.user_id     = st.ColU64(2);
  r.invalidated = st.ColI64(3) != 0;
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result SqliteRepository::InsertTask(Transaction& t, model::TaskRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO tasks(contest_id,name,statement_digest) VALUES(?,?,?);");
  st.U64(1, r.contest_id).Text(2, r.name).Text(3, r.statement_digest);

  const int rc = st.Step();
  if (rc == SQLITE_DONE) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::optional<model::TaskRecord> SqliteRepository::GetTask(Transaction& t, uint64_t task_id) {
  Statement st(TX(t).Handle(), "SELECT id,contest_id,name,statement_digest FROM tasks WHERE id=?;");
  st.U64(1, task_id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::TaskRecord r;
  r.id               = st.ColU64(0);
  r.contest_id       = st.ColU64(1);
  r.name             = st.ColText(2);
  r.statement_digest = st.ColText(3);
  return r;
}

Result SqliteRepository::SetTaskStatement(Transaction& t, uint64_t task_id, const std::string& digest) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE tasks SET statement_digest=? WHERE id=?;");
  st.Text(1, digest).U64(2, task_id);

  const int rc = st.Step();
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "task " + std::to_string(task_id));
  }
  return Translate(db, rc);
}

Result SqliteRepository::InsertTaskFile(Transaction& t, const model::TaskFileRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO task_files(task_id,kind,filename,digest) VALUES(?,?,?,?);");
  st.U64(1, r.task_id).I64(2, static_cast<int>(r.kind)).Text(3, r.filename).Text(4, r.digest);
  return Translate(db, st.Step());
}

std::vector<model::TaskFileRecord> SqliteRepository::ListTaskFiles(Transaction& t, uint64_t task_id,
                                                                   model::TaskFileKind kind) {
  Statement st(TX(t).Handle(),
               "SELECT filename,digest FROM task_files WHERE task_id=? AND kind=? ORDER BY rowid_;");
  st.U64(1, task_id).I64(2, static_cast<int>(kind));

  std::vector<model::TaskFileRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back({task_id, kind, st.ColText(0), st.ColText(1)});
  }
  return out;
}

// ------------------------------------------------------------------
// Testcases
// ------------------------------------------------------------------

uint32_t SqliteRepository::CountTestcases(Transaction& t, uint64_t task_id) {
  Statement st(TX(t).Handle(), "SELECT COUNT(*) FROM testcases WHERE task_id=?;");
  st.U64(1, task_id);
  if (st.Step() != SQLITE_ROW) return 0;
  return static_cast<uint32_t>(st.ColI64(0));
}

Result SqliteRepository::InsertTestcase(Transaction& t, const model::TestcaseRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO testcases(task_id,num,input_digest,output_digest,is_public) VALUES(?,?,?,?,?);");
  st.U64(1, r.task_id).I64(2, r.num).Text(3, r.input_digest).Text(4, r.output_digest).I64(5, r.is_public ? 1 : 0);
  return Translate(db, st.Step());
}

std::vector<model::TestcaseRecord> SqliteRepository::ListTestcases(Transaction& t, uint64_t task_id) {
  Statement st(TX(t).Handle(),
               "SELECT num,input_digest,output_digest,is_public FROM testcases WHERE task_id=? ORDER BY num;");
  st.U64(1, task_id);

  std::vector<model::TestcaseRecord> out;
  while (st.Step() == SQLITE_ROW) {
    model::TestcaseRecord r;
    r.task_id       = task_id;
    r.num           = static_cast<uint32_t>(st.ColI64(0));
    r.input_digest  = st.ColText(1);
    r.output_digest = st.ColText(2);
    r.is_public     = st.ColI64(3) != 0;
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Questions
// ------------------------------------------------------------------

Result SqliteRepository::InsertQuestion(Transaction& t, model::QuestionRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO questions(contest_id,user,question_timestamp,reply_timestamp,subject,text) "
               "VALUES(?,?,?,?,?,?);");
  st.U64(1, r.contest_id).Text(2, r.user).I64(3, r.question_timestamp);
  if (r.reply_timestamp) {
    st.I64(4, *r.reply_timestamp);
  } else {
    st.Null(4);
  }
  st.Text(5, r.subject).Text(6, r.text);

  const int rc = st.Step();
  if (rc == SQLITE_DONE) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::vector<model::QuestionRecord> SqliteRepository::ListUnansweredQuestions(Transaction& t, int64_t since) {
  Statement st(TX(t).Handle(),
               "SELECT id,contest_id,user,question_timestamp,reply_timestamp,subject,text FROM questions "
               "WHERE reply_timestamp IS NULL AND question_timestamp>? ORDER BY question_timestamp,id;");
  st.I64(1, since);

  std::vector<model::QuestionRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadQuestion(st));
  return out;
}

uint64_t SqliteRepository::CountUnansweredQuestions(Transaction& t) {
  Statement st(TX(t).Handle(), "SELECT COUNT(*) FROM questions WHERE reply_timestamp IS NULL;");
  if (st.Step() != SQLITE_ROW) return 0;
  return st.ColU64(0);
}

// ------------------------------------------------------------------
// Submissions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSubmission(Transaction& t, model::SubmissionRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO submissions(task_id,user_id,invalidated) VALUES(?,?,?);");
  st.U64(1, r.task_id).U64(2, r.user_id).I64(3, r.invalidated ? 1 : 0);

  const int rc = st.Step();
  if (rc == SQLITE_DONE) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::optional<model::SubmissionRecord> SqliteRepository::GetSubmission(Transaction& t, uint64_t submission_id) {
  Statement st(TX(t).Handle(), "SELECT id,task_id,user_id,invalidated FROM submissions WHERE id=?;");
  st.U64(1, submission_id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadSubmission(st);
}

std::vector<model::SubmissionRecord> SqliteRepository::ListSubmissionsByTask(Transaction& t, uint64_t task_id) {
  Statement st(TX(t).Handle(),
               "SELECT id,task_id,user_id,invalidated FROM submissions WHERE task_id=? ORDER BY id;");
  st.U64(1, task_id);

  std::vector<model::SubmissionRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadSubmission(st));
  return out;
}

std::vector<model::SubmissionRecord> SqliteRepository::ListSubmissionsByUser(Transaction& t, uint64_t user_id) {
  Statement st(TX(t).Handle(),
               "SELECT id,task_id,user_id,invalidated FROM submissions WHERE user_id=? ORDER BY id;");
  st.U64(1, user_id);

  std::vector<model::SubmissionRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadSubmission(st));
  return out;
}

Result SqliteRepository::InvalidateSubmission(Transaction& t, uint64_t submission_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE submissions SET invalidated=1 WHERE id=?;");
  st.U64(1, submission_id);

  const int rc = st.Step();
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "submission " + std::to_string(submission_id));
  }
  return Translate(db, rc);
}

} // namespace cms::db::sqlite
