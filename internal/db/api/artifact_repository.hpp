#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/artifact_record.hpp"

namespace colguard::db {

/*
  Durable key -> artifact store behind the content cache.

  GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Upsert is last-writer-wins per key; artifacts for one key are
    value-identical no matter which run produced them

  The store is an optimization, never a source of truth.
*/

class ArtifactRepository {
 public:
  virtual ~ArtifactRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual Result UpsertArtifact(Transaction&, const model::ArtifactRecord&) = 0;

  virtual std::optional<model::ArtifactRecord> GetArtifact(Transaction&, const std::string& key) = 0;

  virtual std::vector<model::ArtifactRecord> ListArtifacts(Transaction&) = 0;

  virtual Result DeleteArtifact(Transaction&, const std::string& key) = 0;
};

} // namespace colguard::db
