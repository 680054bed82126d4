#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/recipe_compiler.hpp"
#include "internal/core/render_orchestrator.hpp"
#include "internal/core/transcript_store.hpp"
#include "longform/editor/v1.hpp"

namespace longform::core {

struct VoiceCommandRequest {
  std::string                command;
  std::string                transcript_id;
  std::optional<std::string> deliverable_id;
  bool                       auto_render = false;
  std::optional<std::string> task_id;
};

struct VoiceCommandResult {
  longform::editor::v1::EditRecipe               recipe;
  std::optional<longform::editor::v1::Render>    render;
  std::optional<longform::editor::v1::ErrorInfo> render_error;
  std::vector<std::string>                       dropped_fragments;
  std::string                                    message;
};

/*
  VoiceCommandBridge

  One command in, one recipe out. Extends the deliverable's latest recipe
  when it was compiled against the same transcript, compiles fresh
  otherwise, and optionally starts a render. A failed render leg is
  reported next to the recipe instead of replacing it.
*/
class VoiceCommandBridge {
 public:
  static constexpr const char* kMessageCreated       = "Recipe created successfully";
  static constexpr const char* kMessageRenderStarted = "Recipe created and render started";
  static constexpr const char* kMessageRenderFailed  = "Recipe created; render failed";

  VoiceCommandBridge(std::shared_ptr<TranscriptStore> transcripts, std::shared_ptr<RecipeCompiler> compiler,
                     std::shared_ptr<RenderOrchestrator> renders, longform::editor::v1::RenderQuality auto_render_quality);

  VoiceCommandResult ProcessCommand(const VoiceCommandRequest& request);

 private:
  std::shared_ptr<TranscriptStore>    transcripts_;
  std::shared_ptr<RecipeCompiler>     compiler_;
  std::shared_ptr<RenderOrchestrator> renders_;
  longform::editor::v1::RenderQuality auto_render_quality_;
};

} // namespace longform::core
