#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_artifact_repository.hpp"

namespace colguard::db::memory {

/*
  Transaction = snapshot + write set

  Commit replays the write set onto the latest committed state, so
  concurrent writers resolve last-writer-wins per key.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryArtifactRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  const MemoryArtifactRepository::State& View() const {
    return working_;
  }

  void Upsert(const model::ArtifactRecord& record);
  void Erase(const std::string& key);

 private:
  struct Write {
    std::string                          key;
    std::optional<model::ArtifactRecord> record; // nullopt = delete
  };

  MemoryArtifactRepository&       repo_;
  MemoryArtifactRepository::State working_;
  std::vector<Write>              writes_;
  bool                            committed_   = false;
  bool                            rolled_back_ = false;
};

} // namespace colguard::db::memory
