#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace colguard::model {

struct ColumnDoc {
  std::string name;
  std::string description;
};

using ColumnDocs = std::vector<ColumnDoc>;

/*
  One SQL transformation unit.

  Immutable once the project is loaded for a run.
*/
struct Model {
  std::string           name;
  std::filesystem::path path;
  std::string           raw_sql;

  std::string               description;
  std::optional<ColumnDocs> docs; // nullopt = undocumented
};

struct MacroParam {
  std::string                name;
  std::optional<std::string> default_value; // raw literal text
};

struct Macro {
  std::string             name;
  std::vector<MacroParam> params;
  std::string             body;
  std::filesystem::path   path;
};

// External table declared in documentation only.
struct SourceTable {
  std::string               source_name;
  std::string               name;
  std::string               description;
  std::optional<ColumnDocs> docs;

  std::string NodeKey() const {
    return source_name + "." + name;
  }
};

/*
  Explicit, immutable view of everything known about a project.

  Passed by const reference to every component; nothing reaches into
  global state.
*/
struct Project {
  std::map<std::string, Model>       models;
  std::map<std::string, Macro>       macros;
  std::map<std::string, SourceTable> sources; // keyed by NodeKey()
  std::map<std::string, std::string> vars;

  const Model* FindModel(const std::string& name) const {
    auto it = models.find(name);
    return it == models.end() ? nullptr : &it->second;
  }

  const SourceTable* FindSource(const std::string& source_name, const std::string& name) const {
    auto it = sources.find(source_name + "." + name);
    return it == sources.end() ? nullptr : &it->second;
  }

  const Macro* FindMacro(const std::string& name) const {
    auto it = macros.find(name);
    return it == macros.end() ? nullptr : &it->second;
  }
};

} // namespace colguard::model
