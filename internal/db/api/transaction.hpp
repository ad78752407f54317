#pragma once

namespace colguard::db {

/*
  Unit of work against an artifact store.

  A cache flush writes every new artifact inside one transaction, so a
  crashed or failed flush leaves the previous run's rows untouched.

  - Writes are invisible to other transactions until Commit()
  - Rollback() discards the write set
  - Destroying an uncommitted transaction rolls it back

  SQLite: BEGIN IMMEDIATE
  Memory: snapshot + write set
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace colguard::db
