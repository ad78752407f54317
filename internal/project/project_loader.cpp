#include "internal/project/project_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/render/template_parser.hpp"

namespace colguard::project {

namespace fs = std::filesystem;

namespace {

std::string ReadFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot read " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

bool HasExtension(const fs::path& path, std::initializer_list<const char*> extensions) {
  const auto ext = path.extension().string();
  return std::any_of(extensions.begin(), extensions.end(), [&](const char* e) { return ext == e; });
}

// Regular files below dir, sorted.
std::vector<fs::path> ListFiles(const fs::path& dir) {
  std::vector<fs::path> files;
  if (!fs::is_directory(dir)) {
    COLGUARD_LOG_DEBUG("skipping missing project directory", {observability::StringField("path", dir.string())});
    return files;
  }

  for (const auto& entry : fs::recursive_directory_iterator(dir)) {
    if (entry.is_regular_file()) files.push_back(entry.path());
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::string ScalarOr(const YAML::Node& node, const char* key, const std::string& fallback = "") {
  const auto child = node[key];
  if (!child || !child.IsScalar()) return fallback;
  return child.as<std::string>();
}

std::optional<model::ColumnDocs> ParseColumns(const YAML::Node& node, const fs::path& path) {
  const auto columns = node["columns"];
  if (!columns) return std::nullopt;
  if (!columns.IsSequence()) {
    throw std::runtime_error(path.string() + ": 'columns' must be a list");
  }

  model::ColumnDocs docs;
  for (const auto& column : columns) {
    auto name = ScalarOr(column, "name");
    if (name.empty()) {
      throw std::runtime_error(path.string() + ": column entry without a name");
    }
    docs.push_back(model::ColumnDoc{std::move(name), ScalarOr(column, "description")});
  }
  return docs;
}

void ApplyModelDocs(model::Project& project, const YAML::Node& models, const fs::path& path) {
  for (const auto& entry : models) {
    const auto name = ScalarOr(entry, "name");
    auto       it   = project.models.find(name);
    if (it == project.models.end()) {
      COLGUARD_LOG_WARN("documentation for unknown model ignored", {observability::StringField("model", name),
                                                                     observability::StringField("file", path.string())});
      continue;
    }

    it->second.description = ScalarOr(entry, "description");
    it->second.docs        = ParseColumns(entry, path);
  }
}

void ApplySourceDocs(model::Project& project, const YAML::Node& sources, const fs::path& path) {
  for (const auto& source : sources) {
    const auto source_name = ScalarOr(source, "name");
    if (source_name.empty()) {
      throw std::runtime_error(path.string() + ": source entry without a name");
    }

    const auto tables = source["tables"];
    if (!tables) continue;

    for (const auto& table : tables) {
      model::SourceTable src;
      src.source_name = source_name;
      src.name        = ScalarOr(table, "name");
      src.description = ScalarOr(table, "description");
      src.docs        = ParseColumns(table, path);
      if (src.name.empty()) {
        throw std::runtime_error(path.string() + ": table entry without a name in source '" + source_name + "'");
      }

      auto key = src.NodeKey();
      if (!project.sources.emplace(key, std::move(src)).second) {
        throw std::runtime_error(path.string() + ": duplicate source table '" + key + "'");
      }
    }
  }
}

} // namespace

// ------------------------------------------------------------
// Documentation
// ------------------------------------------------------------

void ProjectLoader::ApplyDocs(model::Project& project, const fs::path& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const std::exception& e) {
    throw std::runtime_error("failed to load documentation " + path.string() + ": " + e.what());
  }

  if (!root || root.IsNull()) return;
  if (!root.IsMap()) {
    throw std::runtime_error(path.string() + ": documentation must be a mapping");
  }

  try {
    if (const auto models = root["models"]) ApplyModelDocs(project, models, path);
    if (const auto sources = root["sources"]) ApplySourceDocs(project, sources, path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(path.string() + ": " + e.what());
  }
}

// ------------------------------------------------------------
// Load
// ------------------------------------------------------------

model::Project ProjectLoader::Load(const config::ProjectConfig& config) {
  model::Project project;

  const fs::path root = config.root().empty() ? fs::path(".") : fs::path(config.root());

  std::vector<fs::path> doc_files;
  for (const auto& dir : config.model_paths()) {
    for (const auto& file : ListFiles(root / dir)) {
      if (HasExtension(file, {".yml", ".yaml"})) {
        doc_files.push_back(file);
        continue;
      }
      if (!HasExtension(file, {".sql"})) continue;

      model::Model model;
      model.name    = file.stem().string();
      model.path    = file;
      model.raw_sql = ReadFile(file);

      auto [it, inserted] = project.models.emplace(model.name, model);
      if (!inserted) {
        throw std::runtime_error("duplicate model '" + model.name + "': " + it->second.path.string() + " and "
                                 + file.string());
      }
    }
  }

  // Docs are applied once every model is known.
  for (const auto& file : doc_files) {
    ApplyDocs(project, file);
  }

  for (const auto& dir : config.macro_paths()) {
    for (const auto& file : ListFiles(root / dir)) {
      if (!HasExtension(file, {".sql"})) continue;

      std::vector<model::Macro> macros;
      try {
        macros = render::ParseMacroFile(ReadFile(file), file);
      } catch (const render::TemplateParseError& e) {
        throw std::runtime_error("invalid macro file " + file.string() + ": " + e.what());
      }

      for (auto& macro : macros) {
        auto name = macro.name;
        if (!project.macros.emplace(name, std::move(macro)).second) {
          throw std::runtime_error("duplicate macro '" + name + "' in " + file.string());
        }
      }
    }
  }

  for (const auto& [name, value] : config.vars()) {
    project.vars[name] = value;
  }

  COLGUARD_LOG_INFO("project loaded", {observability::IntField("models", static_cast<std::int64_t>(project.models.size())),
                                       observability::IntField("sources", static_cast<std::int64_t>(project.sources.size())),
                                       observability::IntField("macros", static_cast<std::int64_t>(project.macros.size()))});
  return project;
}

} // namespace colguard::project
