#pragma once

#include <memory>

#include "internal/db/api/artifact_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace colguard::db::sqlite {

class SqliteArtifactRepository final : public db::ArtifactRepository {
public:
  // Runs the artifact schema migrations on construction.
  explicit SqliteArtifactRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertArtifact(Transaction&, const model::ArtifactRecord&) override;
  std::optional<model::ArtifactRecord> GetArtifact(Transaction&, const std::string& key) override;
  std::vector<model::ArtifactRecord> ListArtifacts(Transaction&) override;
  Result DeleteArtifact(Transaction&, const std::string& key) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
