#include "factory.hpp"

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_artifact_repository.hpp"
#include "internal/observability/logging.hpp"
#if COLGUARD_WITH_SQLITE
#include "internal/db/sqlite/sqlite_artifact_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#endif

namespace colguard::factory {

namespace {

#if COLGUARD_WITH_SQLITE
// An unreadable cache file is discarded and recreated; it only ever holds derived data.
std::shared_ptr<db::ArtifactRepository> OpenSqliteCache(const std::string& path) {
  try {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path);
    if (sqlite_db->IntegrityOk()) {
      return std::make_shared<db::sqlite::SqliteArtifactRepository>(std::move(sqlite_db));
    }
    COLGUARD_LOG_WARN("cache database failed integrity check; recreating", {observability::StringField("path", path)});
  } catch (const std::exception& e) {
    COLGUARD_LOG_WARN("cache database unusable; recreating", {observability::StringField("path", path),
                                                              observability::StringField("error", e.what())});
  }

  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::error_code ec;
    std::filesystem::remove(path + suffix, ec);
  }
  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path);
  return std::make_shared<db::sqlite::SqliteArtifactRepository>(std::move(sqlite_db));
}
#endif

std::shared_ptr<db::ArtifactRepository> BuildRepository(const config::RuntimeConfig& config) {
  const auto& cache = config.cache();
  if (cache.has_enabled() && !cache.enabled()) {
    return nullptr;
  }

  if (cache.has_sqlite()) {
#if COLGUARD_WITH_SQLITE
    if (cache.sqlite().path().empty()) {
      throw std::runtime_error("cache.sqlite.path must be set");
    }
    return OpenSqliteCache(cache.sqlite().path());
#else
    throw std::runtime_error("sqlite cache requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryArtifactRepository>();
}

} // namespace

core::PipelineSettings SettingsFromConfig(const config::RuntimeConfig& config) {
  const auto& analysis = config.analysis();

  core::PipelineSettings settings;
  settings.dialect        = analysis.dialect().empty() ? std::string("ansi") : analysis.dialect();
  settings.worker_threads = analysis.worker_threads();

  settings.render.target_schema     = analysis.target_schema();
  settings.render.macro_depth_limit = analysis.macro_depth_limit() == 0 ? render::kDefaultMacroDepthLimit
                                                                        : analysis.macro_depth_limit();

  settings.cache_validity_minutes = analysis.cache_validity_minutes() == 0 ? config::kDefaultCacheValidityMinutes
                                                                           : analysis.cache_validity_minutes();
  return settings;
}

Application Build(const config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Artifact cache
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  if (app.repository) {
    app.cache   = std::make_shared<cache::ContentCache>(app.repository);
    auto loaded = app.cache->Load();
    COLGUARD_LOG_INFO("cache ready", {observability::StringField("backend", config.cache().has_sqlite() ? "sqlite" : "memory"),
                                      observability::IntField("entries", static_cast<std::int64_t>(loaded))});
  } else {
    COLGUARD_LOG_INFO("cache disabled");
  }

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  app.pipeline = std::make_shared<core::Pipeline>(SettingsFromConfig(config), app.cache);

  return app;
}

} // namespace colguard::factory
