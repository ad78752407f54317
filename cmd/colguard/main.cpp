#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/core/pipeline.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/project/project_loader.hpp"

namespace {

void Usage() {
  std::cerr << "Usage: colguard --config <config.yaml> [--select <selector>]" << std::endl;
}

void Report(const colguard::core::RunReport& report) {
  using colguard::observability::StringField;

  for (const auto& change : report.changes) {
    for (const auto& reason : change.reasons) {
      COLGUARD_LOG_INFO("model needs re-analysis", {StringField("model", change.model),
                                                    StringField("reason", colguard::core::ChangeReasonCodeName(reason.code)),
                                                    StringField("detail", reason.description)});
    }
  }

  for (const auto& failure : report.failures) {
    COLGUARD_LOG_ERROR("model could not be analyzed", {StringField("model", failure.model),
                                                       StringField("kind", colguard::core::FailureKindName(failure.kind)),
                                                       StringField("error", failure.message)});
  }

  for (const auto& d : report.diagnostics) {
    const auto column = d.column.value_or("");
    if (d.severity == colguard::model::Severity::kError) {
      COLGUARD_LOG_ERROR(d.message, {StringField("model", d.model), StringField("column", column)});
    } else {
      COLGUARD_LOG_WARN(d.message, {StringField("model", d.model), StringField("column", column)});
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  std::string selection;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--select" && i + 1 < argc) {
      selection = argv[++i];
    } else {
      Usage();
      return 2;
    }
  }
  if (config_path.empty()) {
    Usage();
    return 2;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = colguard::config::ConfigLoader::LoadFromYaml(config_path);

    colguard::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application and load the project
    // ------------------------------------------------------------
    auto app     = colguard::factory::Build(config);
    auto project = colguard::project::ProjectLoader::Load(config.project());

    // ------------------------------------------------------------
    // Run
    // ------------------------------------------------------------
    colguard::core::RunOptions options;
    options.selection = selection;

    auto report = app.pipeline->Run(project, options);
    Report(report);

    colguard::observability::ShutdownLogging();
    return report.HasErrors() ? 1 : 0;
  } catch (const std::exception& e) {
    COLGUARD_LOG_ERROR("Fatal error", {colguard::observability::StringField("error", e.what())});
    colguard::observability::ShutdownLogging();
    return 2;
  }
}
