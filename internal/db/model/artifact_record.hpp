#pragma once

#include <cstdint>
#include <string>

namespace colguard::db::model {

/*
  One cached artifact row.

  kind mirrors the payload's oneof case ("rendered", "lineage",
  "validation") so rows are distinguishable without decoding.
*/

struct ArtifactRecord {
  std::string key; // 64-char sha256 hex

  std::string kind;

  // serialized colguard.v1.CacheArtifact
  std::string payload;

  // last write time (epoch ms)
  uint64_t updated_at_ms = 0;
};

} // namespace colguard::db::model
