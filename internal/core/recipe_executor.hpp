#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "longform/editor/v1.hpp"

namespace longform::core {

/*
  Applies a recipe's operations, in recipe order, to the transcript's
  source timeline. Each operation sees the result of the previous ones.

  Pure: no I/O, same inputs give identical timelines.
  Throws util::ExecutionError when an operation cannot be resolved
  against the current segments.
*/
longform::editor::v1::EditTimeline ExecuteRecipe(const longform::editor::v1::EditRecipe& recipe,
                                                 const longform::editor::v1::Transcript& transcript);

class RecipeExecutor {
 public:
  explicit RecipeExecutor(std::shared_ptr<db::Repository> repository);

  // Throws util::RecipeNotFound / util::TranscriptNotFound.
  longform::editor::v1::EditTimeline Execute(const std::string& recipe_id, const std::string& transcript_id);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace longform::core
