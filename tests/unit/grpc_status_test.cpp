#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/editing_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/editing_service.hpp"
#include "internal/util/errors.hpp"
#include "longform/editor/v1.hpp"
#include "tests/support/fake_providers.hpp"

namespace {

namespace v1 = longform::editor::v1;

struct Harness {
  Harness() {
    longform::runtime::config::RuntimeConfig config;
    longform::config::ConfigLoader::ApplyDefaults(&config);
    auto ctx = longform::factory::BuildServiceContext(config, std::make_shared<longform::db::memory::MemoryRepository>(), transcription, render);
    server   = std::make_unique<longform::grpc::EditingServer>(std::make_shared<longform::service::EditingService>(ctx));
  }

  std::shared_ptr<longform::testing::FakeTranscriptionProvider> transcription = std::make_shared<longform::testing::FakeTranscriptionProvider>();
  std::shared_ptr<longform::testing::FakeRenderProvider>        render        = std::make_shared<longform::testing::FakeRenderProvider>();
  std::unique_ptr<longform::grpc::EditingServer>                server;
};

v1::Transcript CreateTranscript(Harness& h) {
  v1::CreateTranscriptRequest req;
  req.set_asset_url("s3://media/cat.mp4");
  req.set_deliverable_id("d-1");
  v1::CreateTranscriptResponse resp;
  ::grpc::ServerContext        ctx;
  assert(h.server->CreateTranscript(&ctx, &req, &resp).ok());
  return resp.transcript();
}

void TestErrorKindsMapToStatusCodes() {
  using longform::grpc::ToStatus;
  assert(ToStatus(longform::util::InvalidInput("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(longform::util::RecipeNotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(longform::util::TranscriptNotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(longform::util::RenderNotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(longform::util::TranscriptionFailed("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(longform::util::RenderSubmissionFailed("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(longform::util::ExecutionError("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(longform::util::RenderTimeout("x")).error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED);

  // storage conflicts never leak their kind
  auto conflict = ToStatus(longform::util::Conflict("insert render: render exists: r-1"));
  assert(conflict.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(conflict.error_message() == "internal error");
  assert(conflict.error_details() == "Internal");

  auto recipe_missing = ToStatus(longform::util::RecipeNotFound("recipe not found: r-1"));
  assert(recipe_missing.error_details() == "RecipeNotFound");
  assert(recipe_missing.error_message() == "recipe not found: r-1");

  auto internal = ToStatus(std::runtime_error("sqlite: disk I/O error"));
  assert(internal.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(internal.error_message() == "internal error");
  assert(internal.error_details() == "Internal");
}

void TestMissingRecipeReturnsNotFound() {
  Harness h;

  v1::GetRecipeRequest  req;
  v1::GetRecipeResponse resp;
  req.set_id("missing-recipe");
  ::grpc::ServerContext ctx;

  const auto status = h.server->GetRecipe(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(status.error_details() == "RecipeNotFound");
}

void TestBlankInstructionsReturnInvalidArgument() {
  Harness h;

  v1::CompileRecipeRequest  req;
  v1::CompileRecipeResponse resp;
  req.set_instructions("  ");
  req.set_transcript_text("the cat sat");
  ::grpc::ServerContext ctx;

  assert(h.server->CompileRecipe(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestTranscriptionFailureReturnsUnavailable() {
  Harness h;
  h.transcription->mode = longform::testing::FakeTranscriptionProvider::Mode::kError;

  v1::CreateTranscriptRequest req;
  req.set_asset_url("s3://media/broken.mp4");
  v1::CreateTranscriptResponse resp;
  ::grpc::ServerContext        ctx;

  const auto status = h.server->CreateTranscript(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(status.error_details() == "TranscriptionFailed");
}

void TestEndToEndCompileExecuteRender() {
  Harness h;
  auto    transcript = CreateTranscript(h);

  v1::CompileRecipeRequest compile;
  compile.set_instructions("cut \"cat\"");
  compile.set_transcript_text(transcript.full_text());
  compile.set_deliverable_id("d-1");
  compile.set_transcript_id(transcript.id());
  v1::CompileRecipeResponse compiled;
  {
    ::grpc::ServerContext ctx;
    assert(h.server->CompileRecipe(&ctx, &compile, &compiled).ok());
  }
  assert(compiled.recipe().version() == 1);

  v1::ExecuteRecipeRequest execute;
  execute.set_recipe_id(compiled.recipe().id());
  execute.set_transcript_id(transcript.id());
  v1::ExecuteRecipeResponse executed;
  {
    ::grpc::ServerContext ctx;
    assert(h.server->ExecuteRecipe(&ctx, &execute, &executed).ok());
  }
  assert(executed.timeline().segments_size() == 2);
  assert(executed.timeline().segments(0).source_end_seconds() == 0.3);
  assert(executed.timeline().segments(1).source_start_seconds() == 0.6);

  v1::ExecuteAndRenderRequest render_req;
  render_req.set_recipe_id(compiled.recipe().id());
  render_req.set_transcript_id(transcript.id());
  v1::RenderResponse rendered;
  {
    // task id is mandatory
    ::grpc::ServerContext ctx;
    assert(h.server->ExecuteAndRender(&ctx, &render_req, &rendered).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
  render_req.set_task_id("task-9");
  {
    ::grpc::ServerContext ctx;
    assert(h.server->ExecuteAndRender(&ctx, &render_req, &rendered).ok());
  }
  assert(rendered.render().status() == v1::RENDER_STATUS_QUEUED);
  assert(rendered.render().deliverable_id() == "d-1");

  v1::GetRenderRequest get;
  get.set_id("no-such-render");
  v1::RenderResponse missing;
  {
    ::grpc::ServerContext ctx;
    const auto            status = h.server->GetRender(&ctx, &get, &missing);
    assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
    assert(status.error_details() == "RenderNotFound");
  }

  v1::ListRendersRequest list;
  list.set_deliverable_id("d-1");
  v1::ListRendersResponse listed;
  {
    ::grpc::ServerContext ctx;
    assert(h.server->ListRenders(&ctx, &list, &listed).ok());
  }
  assert(listed.renders_size() == 1);
}

void TestExecutionErrorReturnsFailedPrecondition() {
  Harness h;
  auto    transcript = CreateTranscript(h);

  v1::CompileRecipeRequest compile;
  compile.set_instructions("move segment 2 to the start");
  compile.set_transcript_text(transcript.full_text());
  v1::CompileRecipeResponse compiled;
  {
    ::grpc::ServerContext ctx;
    assert(h.server->CompileRecipe(&ctx, &compile, &compiled).ok());
  }

  v1::ExecuteRecipeRequest execute;
  execute.set_recipe_id(compiled.recipe().id());
  execute.set_transcript_id(transcript.id());
  v1::ExecuteRecipeResponse executed;
  ::grpc::ServerContext     ctx;
  const auto                status = h.server->ExecuteRecipe(&ctx, &execute, &executed);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(status.error_details() == "ExecutionError");
}

void TestVoiceCommandRenderFailureIsStillOk() {
  Harness h;
  auto    transcript = CreateTranscript(h);
  h.render->reject   = true;

  v1::ProcessVoiceCommandRequest req;
  req.set_command("remove filler words");
  req.set_transcript_id(transcript.id());
  req.set_auto_render(true);
  req.set_task_id("task-1");
  v1::ProcessVoiceCommandResponse resp;
  ::grpc::ServerContext           ctx;

  assert(h.server->ProcessVoiceCommand(&ctx, &req, &resp).ok());
  assert(!resp.recipe().id().empty());
  assert(!resp.has_render());
  assert(resp.has_render_error());
  assert(resp.render_error().kind() == "RenderSubmissionFailed");
}

void TestHealthReflectsCollaborators() {
  Harness h;

  v1::HealthRequest  req;
  v1::HealthResponse resp;
  {
    ::grpc::ServerContext ctx;
    assert(h.server->Health(&ctx, &req, &resp).ok());
  }
  assert(resp.editor_healthy());
  assert(resp.generator_healthy());
  assert(resp.has_checked_at());

  h.render->healthy = false;
  {
    ::grpc::ServerContext ctx;
    assert(h.server->Health(&ctx, &req, &resp).ok());
  }
  assert(resp.editor_healthy());
  assert(!resp.generator_healthy());
}

} // namespace

int main() {
  TestErrorKindsMapToStatusCodes();
  TestMissingRecipeReturnsNotFound();
  TestBlankInstructionsReturnInvalidArgument();
  TestTranscriptionFailureReturnsUnavailable();
  TestEndToEndCompileExecuteRender();
  TestExecutionErrorReturnsFailedPrecondition();
  TestVoiceCommandRenderFailureIsStillOk();
  TestHealthReflectsCollaborators();

  std::cout << "longform_editor_unit_grpc_status: pass\n";
  return 0;
}
