#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/recipe_record.hpp"
#include "internal/db/model/render_record.hpp"
#include "internal/db/model/transcript_record.hpp"

namespace longform::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - (deliverable_id, version) is unique for recipes with a deliverable
  - Render updates are fenced on row_version

  The DB is the source of truth for:
    transcripts
    recipes
    renders
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Transcripts
  // ---------------------------------------------------------------------

  virtual Result InsertTranscript(Transaction&, const model::TranscriptRecord&) = 0;

  virtual std::optional<model::TranscriptRecord> GetTranscript(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Recipes
  // ---------------------------------------------------------------------

  // Inserts the recipe with version = max(version for deliverable) + 1 in a
  // single statement and writes the assigned version back into the record.
  // Recipes without a deliverable always get version 1.
  virtual Result InsertRecipeWithNextVersion(Transaction&, model::RecipeRecord&) = 0;

  virtual std::optional<model::RecipeRecord> GetRecipe(Transaction&, const std::string& id) = 0;

  // Newest version first.
  virtual std::vector<model::RecipeRecord> ListRecipes(Transaction&, const std::string& deliverable_id) = 0;

  // ---------------------------------------------------------------------
  // Renders
  // ---------------------------------------------------------------------

  virtual Result InsertRender(Transaction&, const model::RenderRecord&) = 0;

  virtual std::optional<model::RenderRecord> GetRender(Transaction&, const std::string& id) = 0;

  // Succeeds only if the stored row_version equals expected_row_version;
  // the stored row_version is then bumped. Conflict otherwise.
  virtual Result UpdateRender(Transaction&, const model::RenderRecord&, uint64_t expected_row_version) = 0;

  // Newest first, at most filter.limit rows.
  virtual std::vector<model::RenderRecord> ListRenders(Transaction&, const model::RenderFilter& filter) = 0;
};

} // namespace longform::db
