#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace longform::db::sqlite {

using longform::db::ErrorCode;
using longform::db::Result;
namespace v1 = longform::editor::v1;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// empty string is stored as NULL
void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
    return;
  }
  BindText(st, idx, s);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

constexpr const char* kTranscriptColumns =
    "id,deliverable_id,asset_url,words_json,full_text,duration_seconds,meta_json,created_at_ms";

constexpr const char* kRecipeColumns =
    "id,deliverable_id,transcript_id,instructions,operations_json,version,compiler_revision,created_at_ms";

constexpr const char* kRenderColumns =
    "id,deliverable_id,recipe_id,kind,status,task_id,aspect_ratio,provider_job_id,asset_id,metrics_json,row_version,created_at_ms,completed_at_ms";

model::TranscriptRecord ReadTranscript(sqlite3_stmt* st) {
  model::TranscriptRecord r;
  r.id               = ColText(st, 0);
  r.deliverable_id   = ColText(st, 1);
  r.asset_url        = ColText(st, 2);
  r.words_json       = ColText(st, 3);
  r.full_text        = ColText(st, 4);
  r.duration_seconds = ColDouble(st, 5);
  r.meta_json        = ColText(st, 6);
  r.created_at_ms    = ColU64(st, 7);
  return r;
}

model::RecipeRecord ReadRecipe(sqlite3_stmt* st) {
  model::RecipeRecord r;
  r.id                = ColText(st, 0);
  r.deliverable_id    = ColText(st, 1);
  r.transcript_id     = ColText(st, 2);
  r.instructions      = ColText(st, 3);
  r.operations_json   = ColText(st, 4);
  r.version           = static_cast<uint32_t>(ColU64(st, 5));
  r.compiler_revision = ColText(st, 6);
  r.created_at_ms     = ColU64(st, 7);
  return r;
}

model::RenderRecord ReadRender(sqlite3_stmt* st) {
  model::RenderRecord r;
  r.id              = ColText(st, 0);
  r.deliverable_id  = ColText(st, 1);
  r.recipe_id       = ColText(st, 2);
  r.kind            = static_cast<v1::RenderQuality>(ColI32(st, 3));
  r.status          = static_cast<v1::RenderStatus>(ColI32(st, 4));
  r.task_id         = ColText(st, 5);
  r.aspect_ratio    = ColText(st, 6);
  r.provider_job_id = ColText(st, 7);
  r.asset_id        = ColText(st, 8);
  r.metrics_json    = ColText(st, 9);
  r.row_version     = ColU64(st, 10);
  r.created_at_ms   = ColU64(st, 11);
  if (sqlite3_column_type(st, 12) != SQLITE_NULL) {
    r.completed_at_ms = ColU64(st, 12);
  }
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, writer_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Transcripts
// ------------------------------------------------------------------

Result SqliteRepository::InsertTranscript(Transaction& t, const model::TranscriptRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO transcripts(id,deliverable_id,asset_url,words_json,full_text,duration_seconds,meta_json,created_at_ms) "
                    "VALUES(?,?,?,?,?,?,?,?);");

  BindText(st.get(), 1, r.id);
  BindOptionalText(st.get(), 2, r.deliverable_id);
  BindText(st.get(), 3, r.asset_url);
  BindText(st.get(), 4, r.words_json);
  BindText(st.get(), 5, r.full_text);
  BindDouble(st.get(), 6, r.duration_seconds);
  BindText(st.get(), 7, r.meta_json);
  BindU64(st.get(), 8, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::TranscriptRecord> SqliteRepository::GetTranscript(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, (std::string("SELECT ") + kTranscriptColumns + " FROM transcripts WHERE id=?;").c_str());
  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadTranscript(st.get());
}

// ------------------------------------------------------------------
// Recipes
// ------------------------------------------------------------------

Result SqliteRepository::InsertRecipeWithNextVersion(Transaction& t, model::RecipeRecord& r) {
  auto* db = TX(t).Handle();

  // The aggregate always yields one row, so a deliverable with no recipes
  // (or no deliverable at all) starts at 1.
  auto st = Prepare(db,
                    "INSERT INTO edit_recipes(id,deliverable_id,transcript_id,instructions,operations_json,version,compiler_revision,created_at_ms) "
                    "SELECT ?1,?2,?3,?4,?5,"
                    "CASE WHEN ?2 IS NULL THEN 1 ELSE COALESCE(MAX(version),0)+1 END,"
                    "?6,?7 FROM edit_recipes WHERE deliverable_id=?2;");

  BindText(st.get(), 1, r.id);
  BindOptionalText(st.get(), 2, r.deliverable_id);
  BindOptionalText(st.get(), 3, r.transcript_id);
  BindText(st.get(), 4, r.instructions);
  BindText(st.get(), 5, r.operations_json);
  BindText(st.get(), 6, r.compiler_revision);
  BindU64(st.get(), 7, r.created_at_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;

  auto sel = Prepare(db, "SELECT version FROM edit_recipes WHERE id=?;");
  BindText(sel.get(), 1, r.id);
  if (sqlite3_step(sel.get()) != SQLITE_ROW) {
    return Result::Err(ErrorCode::InternalError, "inserted recipe not readable: " + r.id);
  }
  r.version = static_cast<uint32_t>(ColU64(sel.get(), 0));
  return Result::Ok();
}

std::optional<model::RecipeRecord> SqliteRepository::GetRecipe(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, (std::string("SELECT ") + kRecipeColumns + " FROM edit_recipes WHERE id=?;").c_str());
  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadRecipe(st.get());
}

std::vector<model::RecipeRecord> SqliteRepository::ListRecipes(Transaction& t, const std::string& deliverable_id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, (std::string("SELECT ") + kRecipeColumns + " FROM edit_recipes WHERE deliverable_id=? ORDER BY version DESC;").c_str());
  BindText(st.get(), 1, deliverable_id);

  std::vector<model::RecipeRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadRecipe(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Renders
// ------------------------------------------------------------------

Result SqliteRepository::InsertRender(Transaction& t, const model::RenderRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO renders(id,deliverable_id,recipe_id,kind,status,task_id,aspect_ratio,provider_job_id,asset_id,metrics_json,row_version,created_at_ms,completed_at_ms) "
                    "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);");

  BindText(st.get(), 1, r.id);
  BindOptionalText(st.get(), 2, r.deliverable_id);
  BindOptionalText(st.get(), 3, r.recipe_id);
  BindI32(st.get(), 4, static_cast<int>(r.kind));
  BindI32(st.get(), 5, static_cast<int>(r.status));
  BindText(st.get(), 6, r.task_id);
  BindText(st.get(), 7, r.aspect_ratio);
  BindOptionalText(st.get(), 8, r.provider_job_id);
  BindOptionalText(st.get(), 9, r.asset_id);
  BindText(st.get(), 10, r.metrics_json);
  BindU64(st.get(), 11, r.row_version);
  BindU64(st.get(), 12, r.created_at_ms);
  if (r.completed_at_ms) {
    BindU64(st.get(), 13, *r.completed_at_ms);
  } else {
    sqlite3_bind_null(st.get(), 13);
  }

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::RenderRecord> SqliteRepository::GetRender(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, (std::string("SELECT ") + kRenderColumns + " FROM renders WHERE id=?;").c_str());
  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadRender(st.get());
}

Result SqliteRepository::UpdateRender(Transaction& t, const model::RenderRecord& r, uint64_t expected_row_version) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "UPDATE renders SET status=?,provider_job_id=?,asset_id=?,metrics_json=?,completed_at_ms=?,row_version=row_version+1 "
                    "WHERE id=? AND row_version=?;");

  BindI32(st.get(), 1, static_cast<int>(r.status));
  BindOptionalText(st.get(), 2, r.provider_job_id);
  BindOptionalText(st.get(), 3, r.asset_id);
  BindText(st.get(), 4, r.metrics_json);
  if (r.completed_at_ms) {
    BindU64(st.get(), 5, *r.completed_at_ms);
  } else {
    sqlite3_bind_null(st.get(), 5);
  }
  BindText(st.get(), 6, r.id);
  BindU64(st.get(), 7, expected_row_version);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;

  if (sqlite3_changes(db) == 0) {
    auto exists = Prepare(db, "SELECT 1 FROM renders WHERE id=?;");
    BindText(exists.get(), 1, r.id);
    if (sqlite3_step(exists.get()) != SQLITE_ROW) {
      return Result::Err(ErrorCode::NotFound, "render not found: " + r.id);
    }
    return Result::Err(ErrorCode::Conflict, "render modified concurrently: " + r.id);
  }
  return Result::Ok();
}

std::vector<model::RenderRecord> SqliteRepository::ListRenders(Transaction& t, const model::RenderFilter& filter) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kRenderColumns + " FROM renders WHERE 1=1";
  if (filter.deliverable_id) sql += " AND deliverable_id=?1";
  if (filter.kind) sql += " AND kind=?2";
  sql += " ORDER BY created_at_ms DESC, rowid DESC LIMIT ?3;";

  auto st = Prepare(db, sql.c_str());
  if (filter.deliverable_id) BindText(st.get(), 1, *filter.deliverable_id);
  if (filter.kind) BindI32(st.get(), 2, static_cast<int>(*filter.kind));
  BindU64(st.get(), 3, filter.limit);

  std::vector<model::RenderRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadRender(st.get()));
  }
  return out;
}

} // namespace longform::db::sqlite
