#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace colguard::db::sqlite {

/*
  RAII handle on the cache database file.

  Opening creates missing parent directories and applies the PRAGMAs
  in Configure(); schema setup is left to the repository's migrations.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // WAL, relaxed sync, busy timeout
  void Configure();

  // PRAGMA quick_check
  bool IntegrityOk();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace colguard::db::sqlite
