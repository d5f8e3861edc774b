#pragma once

namespace cms::db {

/*
  Unit of work against a Repository.

  An upload session's success action writes its rows through exactly one
  Transaction, so a testcase number and its two digests become visible
  together or not at all. Reads inside the transaction see its own
  writes; nothing is visible to other transactions before Commit().

  Destroying an unfinished transaction rolls it back. Commit() on a
  finished transaction throws.
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  // No-op once finished.
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace cms::db
