#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace longform::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTranscript(Transaction&, const model::TranscriptRecord&) override;
  std::optional<model::TranscriptRecord> GetTranscript(Transaction&, const std::string&) override;

  Result InsertRecipeWithNextVersion(Transaction&, model::RecipeRecord&) override;
  std::optional<model::RecipeRecord> GetRecipe(Transaction&, const std::string&) override;
  std::vector<model::RecipeRecord> ListRecipes(Transaction&, const std::string& deliverable_id) override;

  Result InsertRender(Transaction&, const model::RenderRecord&) override;
  std::optional<model::RenderRecord> GetRender(Transaction&, const std::string&) override;
  Result UpdateRender(Transaction&, const model::RenderRecord&, uint64_t expected_row_version) override;
  std::vector<model::RenderRecord> ListRenders(Transaction&, const model::RenderFilter&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::TranscriptRecord> transcripts;
    std::unordered_map<std::string, model::RecipeRecord> recipes;
    std::unordered_map<std::string, model::RenderRecord> renders;

    // insertion order, used to break created_at ties
    std::vector<std::string> render_order;
  };

  std::mutex mutex_;
  State committed_;
};

}
