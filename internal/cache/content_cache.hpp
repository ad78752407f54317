#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/cache/artifact_codec.hpp"
#include "internal/db/api/artifact_repository.hpp"

namespace colguard::cache {

struct CacheStats {
  std::uint64_t hits    = 0;
  std::uint64_t misses  = 0;
  std::uint64_t corrupt = 0; // undecodable, wrong kind or wrong format version
  std::uint64_t writes  = 0; // rows written by Flush()
  std::uint64_t deletes = 0; // rows removed by Flush()
};

/*
  Content-addressed artifact cache.

  Load() pulls every stored row into memory; Get/Put work on memory only
  and are safe from many threads; Flush() writes new entries and deletes
  pruned ones in one transaction. A bad row is a miss, never an error.

  A key is touched by a hit or a Put. After a complete run every key the
  run still needs has been touched, so PruneUntouched() drops the
  artifacts of superseded fingerprints.
*/
class ContentCache {
 public:
  explicit ContentCache(std::shared_ptr<db::ArtifactRepository> repository);

  // Returns the number of rows loaded.
  std::size_t Load();

  std::optional<v1::CacheArtifact> Get(const std::string& key, ArtifactKind kind) const;
  void                             Put(const std::string& key, const v1::CacheArtifact& artifact);

  // Drops entries not touched since Load() or the previous prune and
  // queues their rows for deletion on the next Flush(). Resets the
  // touched set. Returns the number of entries dropped.
  std::size_t PruneUntouched();

  db::Result Flush();

  std::optional<CachedRender>                   GetRendered(const std::string& key) const;
  std::optional<model::ModelLineage>            GetLineage(const std::string& key) const;
  std::optional<std::vector<model::Diagnostic>> GetValidation(const std::string& key) const;
  std::optional<ModelState>                     GetState(const std::string& key) const;

  CacheStats  Stats() const;
  std::size_t Size() const;

 private:
  struct Entry {
    std::string kind;
    std::string payload; // serialized CacheArtifact
    bool        dirty = false;
  };

  std::shared_ptr<db::ArtifactRepository> repository_;

  mutable std::shared_mutex              mutex_;
  std::unordered_map<std::string, Entry> entries_;
  std::vector<std::string>               pending_deletes_;

  mutable std::mutex                      touched_mutex_;
  mutable std::unordered_set<std::string> touched_;

  mutable std::atomic<std::uint64_t> hits_{0};
  mutable std::atomic<std::uint64_t> misses_{0};
  mutable std::atomic<std::uint64_t> corrupt_{0};
  std::atomic<std::uint64_t>         writes_{0};
  std::atomic<std::uint64_t>         deletes_{0};
};

} // namespace colguard::cache
