#include "internal/db/sql/migrations.hpp"

namespace colguard::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& ArtifactMigrations() {
  static const std::vector<std::string> kArtifactSql = {
      "CREATE TABLE IF NOT EXISTS cache_artifact (key TEXT PRIMARY KEY, kind TEXT NOT NULL, payload BLOB NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS cache_artifact_kind ON cache_artifact(kind);",
      "CREATE TABLE IF NOT EXISTS cache_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO cache_schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};
  return kArtifactSql;
}

} // namespace colguard::db::sql
