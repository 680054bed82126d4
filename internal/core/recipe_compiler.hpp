#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/instruction_parser.hpp"
#include "internal/db/api/repository.hpp"
#include "longform/editor/v1.hpp"

namespace longform::core {

struct CompileRequest {
  std::string                instructions;
  std::string                transcript_text;
  std::optional<std::string> deliverable_id;
  std::optional<std::string> transcript_id;
};

struct CompileResult {
  longform::editor::v1::EditRecipe recipe;
  std::vector<std::string>         dropped_fragments;
};

/*
  RecipeCompiler

  Parses instructions into operations and persists them as a new recipe
  version. Version assignment happens inside the repository insert; a
  uniqueness conflict from a concurrent compile is retried.
*/
class RecipeCompiler {
 public:
  static constexpr const char* kDefaultRevision = "rules-v1";

  RecipeCompiler(std::shared_ptr<db::Repository> repository, ParserOptions options, std::string revision = kDefaultRevision);

  CompileResult Compile(const CompileRequest& request);

  // New version for the base recipe's deliverable: base operations followed
  // by the newly compiled ones.
  CompileResult Extend(const std::string& base_recipe_id, const std::string& instructions, const std::string& transcript_text);

  // Throws util::RecipeNotFound.
  longform::editor::v1::EditRecipe Get(const std::string& id);

  // Newest version first.
  std::vector<longform::editor::v1::EditRecipe> List(const std::string& deliverable_id);

  std::optional<longform::editor::v1::EditRecipe> Latest(const std::string& deliverable_id);

  const std::string& Revision() const {
    return revision_;
  }

 private:
  std::optional<double>            TranscriptDuration(const std::string& transcript_id);
  longform::editor::v1::EditRecipe Persist(longform::editor::v1::EditRecipe recipe);

  std::shared_ptr<db::Repository> repository_;
  InstructionParser               parser_;
  std::string                     revision_;
};

} // namespace longform::core
