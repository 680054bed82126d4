#include "pg_repository.hpp"

#include "longform/editor/v1.hpp"

namespace longform::db::postgres {

namespace v1 = longform::editor::v1;

namespace {

constexpr const char* kRenderColumns =
    "id, deliverable_id, recipe_id, kind, status, task_id, aspect_ratio, provider_job_id, asset_id, metrics_json::text, row_version, created_at_ms, completed_at_ms";

std::optional<std::string> Nullable(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string{} : std::string(f.c_str());
}

model::TranscriptRecord ReadTranscript(const pqxx::row& row) {
  model::TranscriptRecord r;
  r.id               = Text(row[0]);
  r.deliverable_id   = Text(row[1]);
  r.asset_url        = Text(row[2]);
  r.words_json       = Text(row[3]);
  r.full_text        = Text(row[4]);
  r.duration_seconds = row[5].as<double>();
  r.meta_json        = Text(row[6]);
  r.created_at_ms    = row[7].as<uint64_t>();
  return r;
}

model::RecipeRecord ReadRecipe(const pqxx::row& row) {
  model::RecipeRecord r;
  r.id                = Text(row[0]);
  r.deliverable_id    = Text(row[1]);
  r.transcript_id     = Text(row[2]);
  r.instructions      = Text(row[3]);
  r.operations_json   = Text(row[4]);
  r.version           = row[5].as<uint32_t>();
  r.compiler_revision = Text(row[6]);
  r.created_at_ms     = row[7].as<uint64_t>();
  return r;
}

model::RenderRecord ReadRender(const pqxx::row& row) {
  model::RenderRecord r;
  r.id              = Text(row[0]);
  r.deliverable_id  = Text(row[1]);
  r.recipe_id       = Text(row[2]);
  r.kind            = static_cast<v1::RenderQuality>(row[3].as<int>());
  r.status          = static_cast<v1::RenderStatus>(row[4].as<int>());
  r.task_id         = Text(row[5]);
  r.aspect_ratio    = Text(row[6]);
  r.provider_job_id = Text(row[7]);
  r.asset_id        = Text(row[8]);
  r.metrics_json    = Text(row[9]);
  r.row_version     = row[10].as<uint64_t>();
  r.created_at_ms   = row[11].as<uint64_t>();
  if (!row[12].is_null()) {
    r.completed_at_ms = row[12].as<uint64_t>();
  }
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Transcripts
// ------------------------------------------------------------------

Result PgRepository::InsertTranscript(Transaction& t, const model::TranscriptRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_transcript", r.id, Nullable(r.deliverable_id), r.asset_url, r.words_json, r.full_text,
                               r.duration_seconds, Nullable(r.meta_json), r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TranscriptRecord> PgRepository::GetTranscript(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_transcript", id);
  if (res.empty()) return std::nullopt;
  return ReadTranscript(res[0]);
}

// ------------------------------------------------------------------
// Recipes
// ------------------------------------------------------------------

Result PgRepository::InsertRecipeWithNextVersion(Transaction& t, model::RecipeRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_recipe_next_version", r.id, Nullable(r.deliverable_id), Nullable(r.transcript_id),
                                          r.instructions, r.operations_json, r.compiler_revision, r.created_at_ms);
    if (res.empty()) {
      return Result::Err(ErrorCode::InternalError, "recipe insert returned no version: " + r.id);
    }
    r.version = res[0][0].as<uint32_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RecipeRecord> PgRepository::GetRecipe(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_recipe", id);
  if (res.empty()) return std::nullopt;
  return ReadRecipe(res[0]);
}

std::vector<model::RecipeRecord> PgRepository::ListRecipes(Transaction& t, const std::string& deliverable_id) {
  auto res = TX(t).Work().exec_prepared("list_recipes", deliverable_id);

  std::vector<model::RecipeRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRecipe(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Renders
// ------------------------------------------------------------------

Result PgRepository::InsertRender(Transaction& t, const model::RenderRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_render", r.id, Nullable(r.deliverable_id), Nullable(r.recipe_id), static_cast<int>(r.kind),
                               static_cast<int>(r.status), r.task_id, r.aspect_ratio, Nullable(r.provider_job_id), Nullable(r.asset_id),
                               Nullable(r.metrics_json), r.row_version, r.created_at_ms, r.completed_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RenderRecord> PgRepository::GetRender(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_render", id);
  if (res.empty()) return std::nullopt;
  return ReadRender(res[0]);
}

Result PgRepository::UpdateRender(Transaction& t, const model::RenderRecord& r, uint64_t expected_row_version) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_prepared("update_render", r.id, static_cast<int>(r.status), Nullable(r.provider_job_id), Nullable(r.asset_id),
                                    Nullable(r.metrics_json), r.completed_at_ms, expected_row_version);
    if (res.affected_rows() == 0) {
      auto exists = work.exec_params("SELECT 1 FROM renders WHERE id=$1", r.id);
      if (exists.empty()) {
        return Result::Err(ErrorCode::NotFound, "render not found: " + r.id);
      }
      return Result::Err(ErrorCode::Conflict, "render modified concurrently: " + r.id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RenderRecord> PgRepository::ListRenders(Transaction& t, const model::RenderFilter& filter) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRenderColumns +
                                          " FROM renders WHERE ($1::text IS NULL OR deliverable_id=$1::text) "
                                          "AND ($2::smallint IS NULL OR kind=$2::smallint) "
                                          "ORDER BY created_at_ms DESC, seq DESC LIMIT $3",
                                      filter.deliverable_id,
                                      filter.kind ? std::optional<int>(static_cast<int>(*filter.kind)) : std::nullopt,
                                      static_cast<int64_t>(filter.limit));

  std::vector<model::RenderRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRender(row));
  }
  return out;
}

} // namespace longform::db::postgres
