#include "internal/core/voice_command_bridge.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace longform::core {

namespace v1 = longform::editor::v1;
using observability::BoolField;
using observability::StringField;

VoiceCommandBridge::VoiceCommandBridge(std::shared_ptr<TranscriptStore> transcripts, std::shared_ptr<RecipeCompiler> compiler,
                                       std::shared_ptr<RenderOrchestrator> renders, v1::RenderQuality auto_render_quality)
    : transcripts_(std::move(transcripts)),
      compiler_(std::move(compiler)),
      renders_(std::move(renders)),
      auto_render_quality_(auto_render_quality == v1::RENDER_QUALITY_FINAL ? v1::RENDER_QUALITY_FINAL : v1::RENDER_QUALITY_PREVIEW) {
}

VoiceCommandResult VoiceCommandBridge::ProcessCommand(const VoiceCommandRequest& request) {
  if (request.command.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw util::InvalidInput("command is required");
  }
  if (request.transcript_id.empty()) {
    throw util::InvalidInput("transcriptId is required");
  }

  const auto transcript = transcripts_->Get(request.transcript_id);

  std::optional<std::string> deliverable_id = request.deliverable_id;
  if (!deliverable_id && !transcript.deliverable_id().empty()) {
    deliverable_id = transcript.deliverable_id();
  }

  std::optional<v1::EditRecipe> latest;
  if (deliverable_id) {
    latest = compiler_->Latest(*deliverable_id);
  }

  CompileResult compiled;
  if (latest && latest->transcript_id() == request.transcript_id) {
    compiled = compiler_->Extend(latest->id(), request.command, transcript.full_text());
  } else {
    CompileRequest compile;
    compile.instructions    = request.command;
    compile.transcript_text = transcript.full_text();
    compile.deliverable_id  = deliverable_id;
    compile.transcript_id   = request.transcript_id;
    compiled                = compiler_->Compile(compile);
  }

  VoiceCommandResult result;
  result.recipe            = std::move(compiled.recipe);
  result.dropped_fragments = std::move(compiled.dropped_fragments);
  result.message           = kMessageCreated;

  const bool render_requested = request.auto_render && request.task_id && !request.task_id->empty();
  if (render_requested) {
    RenderOptions options;
    options.quality        = auto_render_quality_;
    options.deliverable_id = deliverable_id;
    options.task_id        = *request.task_id;

    try {
      result.render  = renders_->ExecuteAndRender(result.recipe.id(), request.transcript_id, options);
      result.message = kMessageRenderStarted;
    } catch (const util::Error& e) {
      v1::ErrorInfo error;
      error.set_kind(std::string(util::ErrorKindName(e.Kind())));
      error.set_message(e.what());
      result.render_error = std::move(error);
      result.message      = kMessageRenderFailed;
      LONGFORM_LOG_WARN("voice command render failed", {StringField("recipe_id", result.recipe.id()), StringField("kind", result.render_error->kind()),
                                                        StringField("error", e.what())});
    } catch (const std::exception& e) {
      v1::ErrorInfo error;
      error.set_kind(std::string(util::ErrorKindName(util::ErrorKind::kInternal)));
      error.set_message("internal error");
      result.render_error = std::move(error);
      result.message      = kMessageRenderFailed;
      LONGFORM_LOG_ERROR("voice command render failed", {StringField("recipe_id", result.recipe.id()), StringField("error", e.what())});
    }
  }

  LONGFORM_LOG_INFO("voice command processed", {StringField("recipe_id", result.recipe.id()), StringField("transcript_id", request.transcript_id),
                                                BoolField("render_requested", render_requested), BoolField("rendered", result.render.has_value())});
  return result;
}

} // namespace longform::core
