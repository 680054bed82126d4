#pragma once

#include <cstdint>
#include <string>

namespace longform::db::model {

/*
  Persisted edit recipe.

  version is assigned by the repository on insert. Empty deliverable_id
  means the recipe is not attached to a deliverable.
*/
struct RecipeRecord {
  std::string id;
  std::string deliverable_id;
  std::string transcript_id;
  std::string instructions;
  std::string operations_json;
  uint32_t    version = 0;
  std::string compiler_revision;
  uint64_t    created_at_ms = 0;
};

} // namespace longform::db::model
