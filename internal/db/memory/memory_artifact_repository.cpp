#include "memory_artifact_repository.hpp"

#include "memory_tx.hpp"

namespace colguard::db::memory {

MemoryArtifactRepository::MemoryArtifactRepository() = default;

std::unique_ptr<db::Transaction> MemoryArtifactRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryArtifactRepository::UpsertArtifact(Transaction& t, const model::ArtifactRecord& r) {
  if (r.key.empty()) return Result::Err(ErrorCode::ConstraintViolation, "empty artifact key");
  TX(t).Upsert(r);
  return Result::Ok();
}

std::optional<model::ArtifactRecord> MemoryArtifactRepository::GetArtifact(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.artifacts.find(key);
  if (it == s.artifacts.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ArtifactRecord> MemoryArtifactRepository::ListArtifacts(Transaction& t) {
  const auto&                        s = TX(t).View();
  std::vector<model::ArtifactRecord> records;
  records.reserve(s.artifacts.size());
  for (const auto& [_, record] : s.artifacts) {
    records.push_back(record);
  }
  return records;
}

Result MemoryArtifactRepository::DeleteArtifact(Transaction& t, const std::string& key) {
  TX(t).Erase(key);
  return Result::Ok();
}

} // namespace colguard::db::memory
