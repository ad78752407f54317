#pragma once

#include <string>
#include <vector>

namespace colguard::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order.
  Every statement is idempotent, so reruns on an existing store are safe.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Schema of the artifact cache store.
const std::vector<std::string>& ArtifactMigrations();

} // namespace colguard::db::sql
