#include "factory.hpp"

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/instruction_parser.hpp"
#include "internal/core/recipe_compiler.hpp"
#include "internal/core/recipe_executor.hpp"
#include "internal/core/render_orchestrator.hpp"
#include "internal/core/transcript_store.hpp"
#include "internal/core/voice_command_bridge.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/editing_server.hpp"
#include "internal/observability/logging.hpp"
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

namespace longform::factory {

using longform::runtime::config::RenderProfileConfig;
using longform::runtime::config::RuntimeConfig;
using observability::StringField;

namespace {

longform::editor::v1::RenderProfile ToProfile(const RenderProfileConfig& config) {
  longform::editor::v1::RenderProfile profile;
  profile.set_width(config.width());
  profile.set_height(config.height());
  profile.set_bitrate_kbps(config.bitrate_kbps());
  profile.set_frame_rate(config.frame_rate());
  return profile;
}

std::shared_ptr<::grpc::Channel> Connect(const std::string& endpoint, const char* what) {
  if (endpoint.empty()) {
    throw std::runtime_error(std::string(what) + ".endpoint is required");
  }
  return ::grpc::CreateChannel(endpoint, ::grpc::InsecureChannelCredentials());
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if LONGFORM_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    LONGFORM_LOG_INFO("using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if LONGFORM_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::BootstrapSchema(pool);
    LONGFORM_LOG_INFO("using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  LONGFORM_LOG_INFO("using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

service::ServiceContext BuildServiceContext(const RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                                            std::shared_ptr<providers::TranscriptionProvider> transcription,
                                            std::shared_ptr<providers::RenderProvider>        render) {
  const auto& compiler_config = config.compiler();
  const auto& render_config   = config.render();

  core::ParserOptions parser_options;
  parser_options.filler_words.assign(compiler_config.filler_words().begin(), compiler_config.filler_words().end());
  if (compiler_config.default_silence_gap_seconds() > 0) {
    parser_options.default_silence_gap_seconds = compiler_config.default_silence_gap_seconds();
  }
  if (compiler_config.default_overlay_seconds() > 0) {
    parser_options.default_overlay_seconds = compiler_config.default_overlay_seconds();
  }
  if (compiler_config.max_instruction_bytes() > 0) {
    parser_options.max_instruction_bytes = compiler_config.max_instruction_bytes();
  }

  core::RenderSettings render_settings;
  if (render_config.submit_attempts() > 0) {
    render_settings.submit_attempts = render_config.submit_attempts();
  }
  render_settings.job_timeout_ms = render_config.job_timeout_ms();
  if (render_config.has_preview_profile()) {
    render_settings.preview_profile = ToProfile(render_config.preview_profile());
  }
  if (render_config.has_final_profile()) {
    render_settings.final_profile = ToProfile(render_config.final_profile());
  }

  const auto auto_render_quality = config.voice().auto_render_quality() == "final" ? longform::editor::v1::RENDER_QUALITY_FINAL
                                                                                   : longform::editor::v1::RENDER_QUALITY_PREVIEW;

  service::ServiceContext ctx;
  ctx.repository             = repository;
  ctx.transcription_provider = transcription;
  ctx.render_provider        = render;

  ctx.transcripts = std::make_shared<core::TranscriptStore>(repository, transcription);
  ctx.compiler    = std::make_shared<core::RecipeCompiler>(repository, std::move(parser_options), compiler_config.revision());
  ctx.executor    = std::make_shared<core::RecipeExecutor>(repository);
  ctx.renders     = std::make_shared<core::RenderOrchestrator>(repository, render, ctx.executor, std::move(render_settings));
  ctx.voice       = std::make_shared<core::VoiceCommandBridge>(ctx.transcripts, ctx.compiler, ctx.renders, auto_render_quality);
  return ctx;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  auto transcription = std::make_shared<providers::GrpcTranscriptionProvider>(
      Connect(config.transcription().endpoint(), "transcription"), std::chrono::milliseconds(config.transcription().timeout_ms()));
  auto render = std::make_shared<providers::GrpcRenderProvider>(Connect(config.render().endpoint(), "render"),
                                                                std::chrono::milliseconds(config.render().submit_timeout_ms()),
                                                                std::chrono::milliseconds(config.render().poll_timeout_ms()));

  // ------------------------------------------------------------------
  // Pipeline + service
  // ------------------------------------------------------------------
  app.context         = BuildServiceContext(config, std::move(repository), std::move(transcription), std::move(render));
  app.editing_service = std::make_shared<service::EditingService>(app.context);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::EditingServer>(app.editing_service));

  return app;
}

} // namespace longform::factory
