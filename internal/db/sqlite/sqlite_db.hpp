#pragma once

#include <sqlite3.h>

#include <string>

namespace cms::db::sqlite {

/*
  RAII owner of a sqlite3 connection.

  The connection is opened in serialized mode; SqliteTransaction takes
  the write lock up front so callers never interleave statements of two
  transactions.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs one or more statements without result rows (pragmas, DDL, BEGIN/COMMIT).
  void Exec(const std::string& sql);

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace cms::db::sqlite
