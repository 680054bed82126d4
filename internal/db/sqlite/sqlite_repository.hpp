#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace longform::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;
  std::mutex writer_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace longform::db::sqlite
