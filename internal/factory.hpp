#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/cache/content_cache.hpp"
#include "internal/core/pipeline.hpp"
#include "internal/db/api/artifact_repository.hpp"

namespace colguard::factory {

/*
  Application

  Owns the long-lived pieces of one colguard process.
  repository and cache are null when caching is disabled.
*/
struct Application {
  std::shared_ptr<db::ArtifactRepository> repository;
  std::shared_ptr<cache::ContentCache>    cache;
  std::shared_ptr<core::Pipeline>         pipeline;
};

core::PipelineSettings SettingsFromConfig(const config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that knows concrete store types.
  The cache is loaded before returning.
*/
Application Build(const config::RuntimeConfig& config);

} // namespace colguard::factory
