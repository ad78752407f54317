#pragma once

#include <filesystem>

#include "config/config.pb.h"
#include "internal/model/model.hpp"

namespace colguard::project {

/*
  Builds the immutable Project value for a run.

  Model paths:  *.sql        one model each, named after the file stem
                *.yml/*.yaml documentation (models: / sources:)
  Macro paths:  *.sql        {% macro %} definitions

  Paths are relative to ProjectConfig.root; missing directories are
  skipped. Files are visited in sorted order so repeated loads of the
  same tree yield the same Project.

  Throws std::runtime_error naming the file on unreadable files, bad
  YAML, duplicate model / macro / source names and macro parse errors.
*/
class ProjectLoader {
 public:
  static model::Project Load(const config::ProjectConfig& config);

  // Applies one documentation file to an already scanned project.
  static void ApplyDocs(model::Project& project, const std::filesystem::path& path);
};

} // namespace colguard::project
