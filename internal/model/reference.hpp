#pragma once

#include <string>

namespace colguard::model {

enum class ReferenceKind {
  kModel,
  kSource,
};

/*
  Directed dependency discovered while rendering.

  model  ---> ref('name')
  model  ---> source('source_name', 'name')
*/
struct Reference {
  ReferenceKind kind = ReferenceKind::kModel;
  std::string   source_name; // empty for models
  std::string   name;

  // Graph node identity: "name" for models, "source_name.name" for sources.
  std::string NodeKey() const {
    if (kind == ReferenceKind::kSource) {
      return source_name + "." + name;
    }
    return name;
  }

  bool operator==(const Reference& other) const {
    return kind == other.kind && source_name == other.source_name && name == other.name;
  }
};

inline const char* ReferenceKindName(ReferenceKind kind) {
  return kind == ReferenceKind::kSource ? "source" : "model";
}

} // namespace colguard::model
