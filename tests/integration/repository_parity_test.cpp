#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/recipe_record.hpp"
#include "internal/db/model/render_record.hpp"
#include "internal/db/model/transcript_record.hpp"

#if LONGFORM_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

#if LONGFORM_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace {

using longform::db::ErrorCode;
using longform::db::Repository;
using longform::db::memory::MemoryRepository;
using longform::db::model::RecipeRecord;
using longform::db::model::RenderFilter;
using longform::db::model::RenderRecord;
using longform::db::model::TranscriptRecord;
using longform::editor::v1::RENDER_QUALITY_FINAL;
using longform::editor::v1::RENDER_QUALITY_PREVIEW;
using longform::editor::v1::RENDER_STATUS_COMPLETED;
using longform::editor::v1::RENDER_STATUS_QUEUED;
using longform::editor::v1::RENDER_STATUS_RENDERING;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

RecipeRecord MakeRecipe(const std::string& id, const std::string& deliverable_id) {
  RecipeRecord recipe;
  recipe.id                = id;
  recipe.deliverable_id    = deliverable_id;
  recipe.transcript_id     = "t-" + id;
  recipe.instructions      = "remove filler words";
  recipe.operations_json   = R"({"operations":[]})";
  recipe.compiler_revision = "rules-v1";
  recipe.created_at_ms     = NowMs();
  return recipe;
}

RenderRecord MakeRender(const std::string& id, const std::string& deliverable_id, uint64_t created_at_ms) {
  RenderRecord render;
  render.id              = id;
  render.deliverable_id  = deliverable_id;
  render.recipe_id       = "recipe-" + id;
  render.kind            = RENDER_QUALITY_PREVIEW;
  render.status          = RENDER_STATUS_QUEUED;
  render.task_id         = "task-1";
  render.aspect_ratio    = "16:9";
  render.provider_job_id = "job-" + id;
  render.metrics_json    = R"({"submitAttempts":1})";
  render.created_at_ms   = created_at_ms;
  return render;
}

void VerifyTranscriptReadWrite(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();

  TranscriptRecord transcript;
  transcript.id               = id;
  transcript.deliverable_id   = "deliverable-" + id;
  transcript.asset_url        = "s3://media/" + id + ".mp4";
  transcript.words_json       = R"({"words":[{"text":"the","startSeconds":0,"endSeconds":0.3}]})";
  transcript.full_text        = "the";
  transcript.duration_seconds = 12.5;
  transcript.meta_json        = "{}";
  transcript.created_at_ms    = NowMs();

  assert(repo.InsertTranscript(*tx, transcript));

  auto same_tx = repo.GetTranscript(*tx, id);
  assert(same_tx.has_value());
  tx->Commit();

  auto read_tx = repo.Begin();
  auto read    = repo.GetTranscript(*read_tx, id);
  assert(read.has_value());
  assert(read->deliverable_id == transcript.deliverable_id);
  assert(read->asset_url == transcript.asset_url);
  // postgres normalizes JSONB whitespace
  assert(read->words_json.find("\"the\"") != std::string::npos);
  assert(read->full_text == "the");
  assert(read->duration_seconds == 12.5);
  assert(!repo.GetTranscript(*read_tx, id + "-missing").has_value());
  read_tx->Commit();
}

void VerifyRecipeVersioning(Repository& repo, const std::string& prefix) {
  const auto deliverable = prefix + "-deliverable";

  for (uint32_t i = 1; i <= 3; ++i) {
    auto tx     = repo.Begin();
    auto recipe = MakeRecipe(prefix + "-r" + std::to_string(i), deliverable);
    assert(repo.InsertRecipeWithNextVersion(*tx, recipe));
    assert(recipe.version == i);
    tx->Commit();
  }

  {
    auto tx       = repo.Begin();
    auto detached = MakeRecipe(prefix + "-detached", "");
    assert(repo.InsertRecipeWithNextVersion(*tx, detached));
    assert(detached.version == 1);
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto listed = repo.ListRecipes(*tx, deliverable);
  assert(listed.size() == 3);
  assert(listed[0].version == 3);
  assert(listed[1].version == 2);
  assert(listed[2].version == 1);
  assert(listed[0].id == prefix + "-r3");

  auto read = repo.GetRecipe(*tx, prefix + "-r2");
  assert(read.has_value());
  assert(read->version == 2);
  assert(read->operations_json.find("operations") != std::string::npos);
  assert(read->compiler_revision == "rules-v1");
  assert(!repo.GetRecipe(*tx, prefix + "-missing").has_value());
  tx->Commit();
}

void VerifyRenderFencing(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRender(*tx, MakeRender(id, id + "-deliverable", NowMs())));
    tx->Commit();
  }

  uint64_t version = 0;
  {
    auto tx     = repo.Begin();
    auto stored = repo.GetRender(*tx, id);
    assert(stored.has_value());
    version        = stored->row_version;
    stored->status = RENDER_STATUS_RENDERING;
    assert(repo.UpdateRender(*tx, *stored, version));
    tx->Commit();
  }

  {
    // a second writer holding the old row_version loses
    auto tx     = repo.Begin();
    auto stored = repo.GetRender(*tx, id);
    assert(stored.has_value());
    assert(stored->row_version == version + 1);
    assert(stored->status == RENDER_STATUS_RENDERING);

    stored->status          = RENDER_STATUS_COMPLETED;
    stored->asset_id        = "asset-1";
    stored->completed_at_ms = NowMs();
    auto stale              = repo.UpdateRender(*tx, *stored, version);
    assert(!stale);
    assert(stale.code == ErrorCode::Conflict);
    tx->Rollback();
  }

  {
    auto tx     = repo.Begin();
    auto stored = repo.GetRender(*tx, id);
    assert(stored.has_value());
    assert(stored->status == RENDER_STATUS_RENDERING);
    assert(!stored->completed_at_ms.has_value());

    stored->status          = RENDER_STATUS_COMPLETED;
    stored->asset_id        = "asset-1";
    stored->completed_at_ms = NowMs();
    assert(repo.UpdateRender(*tx, *stored, stored->row_version));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto stored = repo.GetRender(*tx, id);
    assert(stored.has_value());
    assert(stored->status == RENDER_STATUS_COMPLETED);
    assert(stored->asset_id == "asset-1");
    assert(stored->completed_at_ms.has_value());

    auto missing = MakeRender(id + "-missing", "", NowMs());
    auto result  = repo.UpdateRender(*tx, missing, 0);
    assert(!result);
    assert(result.code == ErrorCode::NotFound);
    tx->Commit();
  }
}

void VerifyRenderListing(Repository& repo, const std::string& prefix) {
  const auto deliverable = prefix + "-deliverable";
  const auto base        = NowMs();

  {
    auto tx = repo.Begin();
    for (int i = 0; i < 4; ++i) {
      auto render = MakeRender(prefix + "-" + std::to_string(i), deliverable, base + i);
      if (i % 2 == 1) render.kind = RENDER_QUALITY_FINAL;
      assert(repo.InsertRender(*tx, render));
    }
    assert(repo.InsertRender(*tx, MakeRender(prefix + "-other", prefix + "-other-deliverable", base + 10)));
    tx->Commit();
  }

  auto tx = repo.Begin();

  RenderFilter all;
  all.deliverable_id = deliverable;
  auto listed        = repo.ListRenders(*tx, all);
  assert(listed.size() == 4);
  assert(listed[0].id == prefix + "-3");
  assert(listed[3].id == prefix + "-0");

  RenderFilter finals = all;
  finals.kind         = RENDER_QUALITY_FINAL;
  auto final_renders  = repo.ListRenders(*tx, finals);
  assert(final_renders.size() == 2);
  assert(final_renders[0].id == prefix + "-3");
  assert(final_renders[1].id == prefix + "-1");

  RenderFilter limited = all;
  limited.limit        = 1;
  auto newest          = repo.ListRenders(*tx, limited);
  assert(newest.size() == 1);
  assert(newest[0].id == prefix + "-3");

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRender(*tx, MakeRender(id, "", NowMs())));
    tx->Rollback();
  }

  {
    // destructor rolls back an abandoned transaction
    auto tx     = repo.Begin();
    auto recipe = MakeRecipe(id + "-recipe", id + "-deliverable");
    assert(repo.InsertRecipeWithNextVersion(*tx, recipe));
  }

  auto tx = repo.Begin();
  assert(!repo.GetRender(*tx, id).has_value());
  assert(!repo.GetRecipe(*tx, id + "-recipe").has_value());
  assert(repo.ListRecipes(*tx, id + "-deliverable").empty());
  tx->Commit();
}

void VerifyDuplicateRender(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertRender(*tx, MakeRender(id, "", NowMs())));
    tx->Commit();
  }
  auto tx     = repo.Begin();
  auto result = repo.InsertRender(*tx, MakeRender(id, "", NowMs()));
  assert(!result);
  tx->Rollback();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx     = repo->Begin();
    auto recipe = MakeRecipe(id, id + "-deliverable");
    assert(repo->InsertRecipeWithNextVersion(*tx, recipe));
    assert(repo->InsertRender(*tx, MakeRender(id, id + "-deliverable", NowMs())));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx     = repo->Begin();
  auto recipe = repo->GetRecipe(*tx, id);
  assert(recipe.has_value());
  assert(recipe->version == 1);
  auto render = repo->GetRender(*tx, id);
  assert(render.has_value());
  assert(render->status == RENDER_STATUS_QUEUED);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if LONGFORM_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("longform_editor_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<longform::db::sqlite::SqliteDB>(db_path);
    longform::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<longform::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if LONGFORM_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("LONGFORM_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("LONGFORM_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<longform::db::postgres::PgPool>(conninfo);
    longform::db::postgres::BootstrapSchema(pool);
    return std::make_shared<longform::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // postgres tables outlive the process, keep ids unique per run
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyTranscriptReadWrite(*repo, prefix + "-transcript");
  VerifyRecipeVersioning(*repo, prefix + "-recipes");
  VerifyRenderFencing(*repo, prefix + "-fenced");
  VerifyRenderListing(*repo, prefix + "-listing");
  VerifyRollbackBehavior(*repo, prefix + "-rollback");
  VerifyDuplicateRender(*repo, prefix + "-duplicate");

  repo.reset();
  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if LONGFORM_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if LONGFORM_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "longform_editor_integration_repository_parity: pass\n";
  return 0;
}
