#include "internal/cache/content_cache.hpp"

#include <chrono>
#include <mutex>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace colguard::cache {

namespace {

std::uint64_t NowMs() {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace

ContentCache::ContentCache(std::shared_ptr<db::ArtifactRepository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("ContentCache requires a repository");
  }
}

// ------------------------------------------------------------
// Load
// ------------------------------------------------------------

std::size_t ContentCache::Load() {
  std::vector<db::model::ArtifactRecord> rows;
  try {
    auto tx = repository_->Begin();
    rows    = repository_->ListArtifacts(*tx);
    tx->Commit();
  } catch (const std::exception& e) {
    COLGUARD_LOG_WARN("cache load failed; starting empty", {observability::StringField("error", e.what())});
    return 0;
  }

  std::unique_lock lock(mutex_);
  for (auto& row : rows) {
    entries_[row.key] = Entry{std::move(row.kind), std::move(row.payload), false};
  }

  COLGUARD_LOG_DEBUG("cache loaded", {observability::IntField("entries", static_cast<std::int64_t>(entries_.size()))});
  return rows.size();
}

// ------------------------------------------------------------
// Get / Put
// ------------------------------------------------------------

std::optional<v1::CacheArtifact> ContentCache::Get(const std::string& key, ArtifactKind kind) const {
  std::shared_lock lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end()) {
    ++misses_;
    return std::nullopt;
  }

  const char* want = ArtifactKindName(kind);
  v1::CacheArtifact artifact;
  const bool        decoded = it->second.kind == want && artifact.ParseFromString(it->second.payload)
                       && artifact.format_version() == kArtifactFormatVersion && KindOf(artifact) == kind;
  if (!decoded) {
    ++corrupt_;
    ++misses_;
    COLGUARD_LOG_WARN("ignoring unusable cache entry", {observability::StringField("key", key),
                                                        observability::StringField("kind", it->second.kind),
                                                        observability::StringField("expected", want)});
    return std::nullopt;
  }

  ++hits_;
  {
    std::lock_guard touched_lock(touched_mutex_);
    touched_.insert(key);
  }
  return artifact;
}

void ContentCache::Put(const std::string& key, const v1::CacheArtifact& artifact) {
  const auto kind = KindOf(artifact);
  if (!kind) {
    throw std::invalid_argument("cache artifact has no payload");
  }

  std::string payload;
  if (!artifact.SerializeToString(&payload)) {
    throw std::runtime_error("failed to serialize cache artifact");
  }

  std::unique_lock lock(mutex_);
  entries_[key] = Entry{ArtifactKindName(*kind), std::move(payload), true};

  std::lock_guard touched_lock(touched_mutex_);
  touched_.insert(key);
}

std::optional<CachedRender> ContentCache::GetRendered(const std::string& key) const {
  auto artifact = Get(key, ArtifactKind::kRendered);
  if (!artifact) return std::nullopt;
  return DecodeRendered(artifact->rendered());
}

std::optional<model::ModelLineage> ContentCache::GetLineage(const std::string& key) const {
  auto artifact = Get(key, ArtifactKind::kLineage);
  if (!artifact) return std::nullopt;
  return DecodeLineage(artifact->lineage());
}

std::optional<std::vector<model::Diagnostic>> ContentCache::GetValidation(const std::string& key) const {
  auto artifact = Get(key, ArtifactKind::kValidation);
  if (!artifact) return std::nullopt;
  return DecodeValidation(artifact->validation());
}

std::optional<ModelState> ContentCache::GetState(const std::string& key) const {
  auto artifact = Get(key, ArtifactKind::kState);
  if (!artifact) return std::nullopt;
  return DecodeState(artifact->state());
}

// ------------------------------------------------------------
// Prune / Flush
// ------------------------------------------------------------

std::size_t ContentCache::PruneUntouched() {
  std::unique_lock lock(mutex_);
  std::lock_guard  touched_lock(touched_mutex_);

  std::size_t pruned = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (touched_.count(it->first) != 0) {
      ++it;
      continue;
    }
    // Never-flushed entries have no row to delete.
    if (!it->second.dirty) pending_deletes_.push_back(it->first);
    it = entries_.erase(it);
    ++pruned;
  }
  touched_.clear();

  if (pruned > 0) {
    COLGUARD_LOG_DEBUG("cache pruned", {observability::IntField("entries", static_cast<std::int64_t>(pruned))});
  }
  return pruned;
}

db::Result ContentCache::Flush() {
  std::unique_lock lock(mutex_);

  std::vector<std::string> dirty;
  for (const auto& [key, entry] : entries_) {
    if (entry.dirty) dirty.push_back(key);
  }
  if (dirty.empty() && pending_deletes_.empty()) {
    return db::Result::Ok();
  }

  const auto now = NowMs();
  try {
    auto tx = repository_->Begin();
    // Deletes first: a pruned key may have been Put again since.
    for (const auto& key : pending_deletes_) {
      auto result = repository_->DeleteArtifact(*tx, key);
      if (!result) {
        tx->Rollback();
        COLGUARD_LOG_WARN("cache flush failed", {observability::StringField("key", key),
                                                 observability::StringField("code", db::ErrorCodeName(result.code)),
                                                 observability::StringField("error", result.message)});
        return result;
      }
    }
    for (const auto& key : dirty) {
      const auto&              entry = entries_.at(key);
      db::model::ArtifactRecord record{key, entry.kind, entry.payload, now};

      auto result = repository_->UpsertArtifact(*tx, record);
      if (!result) {
        tx->Rollback();
        COLGUARD_LOG_WARN("cache flush failed", {observability::StringField("key", key),
                                                 observability::StringField("code", db::ErrorCodeName(result.code)),
                                                 observability::StringField("error", result.message)});
        return result;
      }
    }
    tx->Commit();
  } catch (const std::exception& e) {
    COLGUARD_LOG_WARN("cache flush failed", {observability::StringField("error", e.what())});
    return db::Result::Err(db::ErrorCode::IOError, e.what());
  }

  for (const auto& key : dirty) {
    entries_[key].dirty = false;
  }
  writes_ += dirty.size();
  deletes_ += pending_deletes_.size();

  COLGUARD_LOG_DEBUG("cache flushed", {observability::IntField("rows", static_cast<std::int64_t>(dirty.size())),
                                       observability::IntField("deleted", static_cast<std::int64_t>(pending_deletes_.size()))});
  pending_deletes_.clear();
  return db::Result::Ok();
}

// ------------------------------------------------------------
// Stats
// ------------------------------------------------------------

CacheStats ContentCache::Stats() const {
  return CacheStats{hits_.load(), misses_.load(), corrupt_.load(), writes_.load(), deletes_.load()};
}

std::size_t ContentCache::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

} // namespace colguard::cache
