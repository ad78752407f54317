#include "memory_tx.hpp"

#include <stdexcept>

namespace colguard::db::memory {

MemoryTransaction::MemoryTransaction(MemoryArtifactRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Upsert(const model::ArtifactRecord& record) {
  working_.artifacts[record.key] = record;
  writes_.push_back({record.key, record});
}

void MemoryTransaction::Erase(const std::string& key) {
  working_.artifacts.erase(key);
  writes_.push_back({key, std::nullopt});
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("transaction already finished");
  }
  std::scoped_lock lock(repo_.mutex_);
  for (auto& write : writes_) {
    if (write.record) {
      repo_.committed_.artifacts[write.key] = std::move(*write.record);
    } else {
      repo_.committed_.artifacts.erase(write.key);
    }
  }
  writes_.clear();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  writes_.clear();
  rolled_back_ = true;
}

} // namespace colguard::db::memory
