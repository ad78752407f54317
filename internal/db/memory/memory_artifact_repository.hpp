#pragma once

#include <cstdint>
#include <map>
#include <mutex>

#include "internal/db/api/artifact_repository.hpp"

namespace colguard::db::memory {

class MemoryTransaction;

class MemoryArtifactRepository final : public db::ArtifactRepository {
public:
  MemoryArtifactRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertArtifact(Transaction&, const model::ArtifactRecord&) override;
  std::optional<model::ArtifactRecord> GetArtifact(Transaction&, const std::string& key) override;
  std::vector<model::ArtifactRecord> ListArtifacts(Transaction&) override;
  Result DeleteArtifact(Transaction&, const std::string& key) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::ArtifactRecord> artifacts;
  };

  std::mutex mutex_;
  State committed_;
};

}
