#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace cms::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS tasks ("
      "id INTEGER PRIMARY KEY AUTOINCREMENT, contest_id INTEGER NOT NULL, name TEXT NOT NULL, "
      "statement_digest TEXT NOT NULL DEFAULT '');",

      "CREATE TABLE IF NOT EXISTS task_files ("
      "rowid_ INTEGER PRIMARY KEY AUTOINCREMENT, "
      "task_id INTEGER NOT NULL REFERENCES tasks(id) ON DELETE CASCADE, kind INTEGER NOT NULL, "
      "filename TEXT NOT NULL, digest TEXT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS testcases ("
      "task_id INTEGER NOT NULL REFERENCES tasks(id) ON DELETE CASCADE, num INTEGER NOT NULL, "
      "input_digest TEXT NOT NULL, output_digest TEXT NOT NULL, is_public INTEGER NOT NULL, "
      "PRIMARY KEY (task_id, num));",

      "CREATE TABLE IF NOT EXISTS questions ("
      "id INTEGER PRIMARY KEY AUTOINCREMENT, contest_id INTEGER NOT NULL, user TEXT NOT NULL, "
      "question_timestamp INTEGER NOT NULL, reply_timestamp INTEGER, "
      "subject TEXT NOT NULL, text TEXT NOT NULL);",

      "CREATE INDEX IF NOT EXISTS questions_unanswered ON questions(question_timestamp) "
      "WHERE reply_timestamp IS NULL;",

      "CREATE TABLE IF NOT EXISTS submissions ("
      "id INTEGER PRIMARY KEY AUTOINCREMENT, task_id INTEGER NOT NULL, user_id INTEGER NOT NULL, "
      "invalidated INTEGER NOT NULL DEFAULT 0);"};

  for (const auto& sql : kSchema) {
    db.Exec(sql);
  }
}

} // namespace cms::db::sqlite
