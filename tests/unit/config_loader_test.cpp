#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "colguard_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
cache:
  enabled: true
  sqlite:
    path: "/tmp/colguard cache.db"
analysis:
  dialect: snowflake
  macro_depth_limit: 8
  worker_threads: 3
  target_schema: analytics
  cache_validity_minutes: 90
project:
  root: /srv/project
  model_paths: [models, staging]
  macro_paths: [macros]
  vars:
    start_date: "2024-01-01"
    region: emea
)");

  auto config = colguard::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.cache().enabled());
  assert(config.cache().has_sqlite());
  assert(config.cache().sqlite().path() == "/tmp/colguard cache.db");
  assert(config.analysis().dialect() == "snowflake");
  assert(config.analysis().macro_depth_limit() == 8);
  assert(config.analysis().worker_threads() == 3);
  assert(config.project().model_paths_size() == 2);
  assert(config.project().model_paths(1) == "staging");
  assert(config.project().vars().at("start_date") == "2024-01-01");
  assert(config.project().vars().at("region") == "emea");

  auto settings = colguard::factory::SettingsFromConfig(config);
  assert(settings.dialect == "snowflake");
  assert(settings.render.macro_depth_limit == 8);
  assert(settings.render.target_schema == "analytics");
  assert(settings.worker_threads == 3);
  assert(settings.cache_validity_minutes == 90);
}

void TestDefaultsAreApplied() {
  const auto yaml_path = WriteYaml("defaults", R"(logging:
  level: info
)");

  auto config = colguard::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.analysis().dialect() == "ansi");
  assert(config.analysis().macro_depth_limit() == colguard::config::kDefaultMacroDepthLimit);
  assert(config.analysis().cache_validity_minutes() == 1440);
  assert(colguard::factory::SettingsFromConfig(config).cache_validity_minutes == 1440);
  assert(config.project().root() == ".");
  assert(config.project().model_paths_size() == 1);
  assert(config.project().model_paths(0) == "models");
  assert(config.project().macro_paths(0) == "macros");
  assert(config.cache().has_enabled() && config.cache().enabled());
  assert(!config.cache().has_sqlite());

  auto defaults = colguard::config::ConfigLoader::Default();
  assert(defaults.analysis().dialect() == "ansi");
}

void TestCacheCanBeDisabled() {
  const auto yaml_path = WriteYaml("cache_disabled", R"(cache:
  enabled: false
)");

  auto config = colguard::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.cache().has_enabled());
  assert(!config.cache().enabled());

  auto app = colguard::factory::Build(config);
  assert(!app.cache);
  assert(!app.repository);
  assert(app.pipeline);
}

void TestMemoryCacheIsTheDefaultBackend() {
  auto app = colguard::factory::Build(colguard::config::ConfigLoader::Default());
  assert(app.cache);
  assert(app.cache->Size() == 0);
}

#if COLGUARD_WITH_SQLITE
void TestUnreadableSqliteCacheIsRecreated() {
  const auto dir = std::filesystem::temp_directory_path() / "colguard_config_loader_tests" / "sqlite_recovery";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  const auto    db_path = dir / "cache.db";
  std::ofstream garbage(db_path, std::ios::binary);
  garbage << std::string(4096, 'x');
  garbage.close();

  auto config = colguard::config::ConfigLoader::Default();
  config.mutable_cache()->mutable_sqlite()->set_path(db_path.string());

  auto app = colguard::factory::Build(config);
  assert(app.cache);
  assert(app.cache->Size() == 0);

  // missing parent directories are created
  config.mutable_cache()->mutable_sqlite()->set_path((dir / "nested" / "deeper" / "cache.db").string());
  auto nested = colguard::factory::Build(config);
  assert(nested.repository);
  assert(std::filesystem::exists(dir / "nested" / "deeper" / "cache.db"));
}
#endif

void TestLogFileReceivesQuotedFields() {
  const auto log_path = std::filesystem::temp_directory_path() / "colguard_config_loader_tests" / "colguard.log";
  std::filesystem::remove(log_path);

  auto config = colguard::config::ConfigLoader::Default();
  config.mutable_logging()->set_level("info");
  config.mutable_logging()->set_file(log_path.string());
  colguard::observability::InitializeLogging(config);

  COLGUARD_LOG_WARN("model failed", {colguard::observability::StringField("model", "orders"),
                                     colguard::observability::StringField("file", "models/my orders.sql")});

  std::ifstream     in(log_path);
  std::stringstream contents;
  contents << in.rdbuf();
  assert(contents.str().find("model failed model=orders file=\"models/my orders.sql\"") != std::string::npos);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(analysis:
  dialect: postgres
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)colguard::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)colguard::config::ConfigLoader::LoadFromYaml("/nonexistent/colguard.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestDefaultsAreApplied();
  TestCacheCanBeDisabled();
  TestMemoryCacheIsTheDefaultBackend();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();
#if COLGUARD_WITH_SQLITE
  TestUnreadableSqliteCacheIsRecreated();
#endif
  TestLogFileReceivesQuotedFields();

  std::cout << "colguard_unit_config_loader: pass\n";
  return 0;
}
