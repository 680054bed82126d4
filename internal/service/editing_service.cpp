#include "internal/service/editing_service.hpp"

#include <chrono>
#include <optional>
#include <string>

#include "internal/core/recipe_compiler.hpp"
#include "internal/core/recipe_executor.hpp"
#include "internal/core/render_orchestrator.hpp"
#include "internal/core/transcript_store.hpp"
#include "internal/core/voice_command_bridge.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/providers/render_provider.hpp"
#include "internal/providers/transcription_provider.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace longform::service {

using namespace longform::editor::v1;
using observability::StringField;

namespace {

std::optional<std::string> OptionalString(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

core::RenderOptions BuildRenderOptions(RenderQuality quality, const std::string& recipe_id, const std::string& deliverable_id,
                                       const std::string& task_id, const std::string& aspect_ratio) {
  core::RenderOptions options;
  options.quality        = quality;
  options.recipe_id      = OptionalString(recipe_id);
  options.deliverable_id = OptionalString(deliverable_id);
  options.task_id        = task_id;
  options.aspect_ratio   = aspect_ratio;
  return options;
}

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&]() { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };

  try {
    auto result = fn();
    observability::Metrics::Instance().RecordRequest(route, true);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    return result;
  } catch (const util::Error& ex) {
    span.RecordException(ex.what());
    LONGFORM_LOG_WARN("RPC failed", {StringField("route", route), StringField("kind", util::ErrorKindName(ex.Kind())), StringField("error", ex.what())});
    observability::Metrics::Instance().RecordRequest(route, false);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    LONGFORM_LOG_ERROR("RPC failed", {StringField("route", route), StringField("error", ex.what())});
    observability::Metrics::Instance().RecordRequest(route, false);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace

EditingService::EditingService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateTranscriptResponse EditingService::CreateTranscript(const CreateTranscriptRequest& req) {
  return ObserveRpc("EditingService.CreateTranscript", [&] {
    CreateTranscriptResponse resp;
    *resp.mutable_transcript() = ctx_.transcripts->Transcribe(req.asset_url(), OptionalString(req.deliverable_id()));
    return resp;
  });
}

GetTranscriptResponse EditingService::GetTranscript(const GetTranscriptRequest& req) {
  return ObserveRpc("EditingService.GetTranscript", [&] {
    GetTranscriptResponse resp;
    *resp.mutable_transcript() = ctx_.transcripts->Get(req.id());
    return resp;
  });
}

CompileRecipeResponse EditingService::CompileRecipe(const CompileRecipeRequest& req) {
  return ObserveRpc("EditingService.CompileRecipe", [&] {
    core::CompileRequest compile;
    compile.instructions    = req.instructions();
    compile.transcript_text = req.transcript_text();
    compile.deliverable_id  = OptionalString(req.deliverable_id());
    compile.transcript_id   = OptionalString(req.transcript_id());

    auto result = ctx_.compiler->Compile(compile);

    CompileRecipeResponse resp;
    *resp.mutable_recipe() = std::move(result.recipe);
    for (auto& fragment : result.dropped_fragments) {
      resp.add_dropped_fragments(std::move(fragment));
    }
    return resp;
  });
}

CompileRecipeResponse EditingService::ExtendRecipe(const ExtendRecipeRequest& req) {
  return ObserveRpc("EditingService.ExtendRecipe", [&] {
    auto result = ctx_.compiler->Extend(req.base_recipe_id(), req.instructions(), req.transcript_text());

    CompileRecipeResponse resp;
    *resp.mutable_recipe() = std::move(result.recipe);
    for (auto& fragment : result.dropped_fragments) {
      resp.add_dropped_fragments(std::move(fragment));
    }
    return resp;
  });
}

GetRecipeResponse EditingService::GetRecipe(const GetRecipeRequest& req) {
  return ObserveRpc("EditingService.GetRecipe", [&] {
    GetRecipeResponse resp;
    *resp.mutable_recipe() = ctx_.compiler->Get(req.id());
    return resp;
  });
}

ListRecipesResponse EditingService::ListRecipes(const ListRecipesRequest& req) {
  return ObserveRpc("EditingService.ListRecipes", [&] {
    ListRecipesResponse resp;
    for (auto& recipe : ctx_.compiler->List(req.deliverable_id())) {
      *resp.add_recipes() = std::move(recipe);
    }
    return resp;
  });
}

ExecuteRecipeResponse EditingService::ExecuteRecipe(const ExecuteRecipeRequest& req) {
  return ObserveRpc("EditingService.ExecuteRecipe", [&] {
    ExecuteRecipeResponse resp;
    *resp.mutable_timeline() = ctx_.executor->Execute(req.recipe_id(), req.transcript_id());
    return resp;
  });
}

RenderResponse EditingService::RenderTimeline(const RenderTimelineRequest& req) {
  return ObserveRpc("EditingService.RenderTimeline", [&] {
    auto options = BuildRenderOptions(req.quality(), req.recipe_id(), req.deliverable_id(), req.task_id(), req.aspect_ratio());

    RenderResponse resp;
    *resp.mutable_render() = ctx_.renders->RenderTimeline(req.timeline(), options);
    return resp;
  });
}

RenderResponse EditingService::RenderScript(const RenderScriptRequest& req) {
  return ObserveRpc("EditingService.RenderScript", [&] {
    auto options = BuildRenderOptions(req.quality(), req.recipe_id(), req.deliverable_id(), req.task_id(), req.aspect_ratio());

    RenderResponse resp;
    *resp.mutable_render() = ctx_.renders->RenderScript(req.script_text(), options);
    return resp;
  });
}

RenderResponse EditingService::ExecuteAndRender(const ExecuteAndRenderRequest& req) {
  return ObserveRpc("EditingService.ExecuteAndRender", [&] {
    auto options = BuildRenderOptions(req.quality(), req.recipe_id(), req.deliverable_id(), req.task_id(), req.aspect_ratio());

    RenderResponse resp;
    *resp.mutable_render() = ctx_.renders->ExecuteAndRender(req.recipe_id(), req.transcript_id(), options);
    return resp;
  });
}

RenderResponse EditingService::GetRender(const GetRenderRequest& req) {
  return ObserveRpc("EditingService.GetRender", [&] {
    RenderResponse resp;
    *resp.mutable_render() = ctx_.renders->GetStatus(req.id());
    return resp;
  });
}

ListRendersResponse EditingService::ListRenders(const ListRendersRequest& req) {
  return ObserveRpc("EditingService.ListRenders", [&] {
    std::optional<RenderQuality> kind;
    if (req.kind() != RENDER_QUALITY_UNSPECIFIED) {
      kind = req.kind();
    }

    ListRendersResponse resp;
    for (auto& render : ctx_.renders->List(OptionalString(req.deliverable_id()), kind)) {
      *resp.add_renders() = std::move(render);
    }
    return resp;
  });
}

ProcessVoiceCommandResponse EditingService::ProcessVoiceCommand(const ProcessVoiceCommandRequest& req) {
  return ObserveRpc("EditingService.ProcessVoiceCommand", [&] {
    core::VoiceCommandRequest command;
    command.command        = req.command();
    command.transcript_id  = req.transcript_id();
    command.deliverable_id = OptionalString(req.deliverable_id());
    command.auto_render    = req.auto_render();
    command.task_id        = OptionalString(req.task_id());

    auto result = ctx_.voice->ProcessCommand(command);

    ProcessVoiceCommandResponse resp;
    *resp.mutable_recipe() = std::move(result.recipe);
    if (result.render) {
      *resp.mutable_render() = std::move(*result.render);
    }
    if (result.render_error) {
      *resp.mutable_render_error() = std::move(*result.render_error);
    }
    for (auto& fragment : result.dropped_fragments) {
      resp.add_dropped_fragments(std::move(fragment));
    }
    resp.set_message(result.message);
    return resp;
  });
}

HealthResponse EditingService::Health() {
  observability::SpanScope span("EditingService.Health");

  bool storage_ok = false;
  try {
    auto tx = ctx_.repository->Begin();
    tx->Commit();
    storage_ok = true;
  } catch (const std::exception& e) {
    LONGFORM_LOG_WARN("storage health check failed", {StringField("error", e.what())});
  }

  const bool transcription_ok = ctx_.transcription_provider && ctx_.transcription_provider->Healthy();
  const bool render_ok        = ctx_.render_provider && ctx_.render_provider->Healthy();

  HealthResponse resp;
  resp.set_editor_healthy(storage_ok && transcription_ok);
  resp.set_generator_healthy(render_ok);
  *resp.mutable_checked_at() = util::ToProto(util::Now());
  return resp;
}

} // namespace longform::service
