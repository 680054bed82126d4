#pragma once

#include "internal/service/service_context.hpp"
#include "longform/editor/v1.hpp"

namespace longform::service {

/*
  EditingService

  Request validation and conversion between the wire messages and the
  pipeline components. Errors propagate as util::Error exceptions; the
  gRPC adapter maps them onto status codes.
*/
class EditingService {
 public:
  explicit EditingService(ServiceContext ctx);

  longform::editor::v1::CreateTranscriptResponse CreateTranscript(const longform::editor::v1::CreateTranscriptRequest& req);
  longform::editor::v1::GetTranscriptResponse    GetTranscript(const longform::editor::v1::GetTranscriptRequest& req);

  longform::editor::v1::CompileRecipeResponse CompileRecipe(const longform::editor::v1::CompileRecipeRequest& req);
  longform::editor::v1::CompileRecipeResponse ExtendRecipe(const longform::editor::v1::ExtendRecipeRequest& req);
  longform::editor::v1::GetRecipeResponse     GetRecipe(const longform::editor::v1::GetRecipeRequest& req);
  longform::editor::v1::ListRecipesResponse   ListRecipes(const longform::editor::v1::ListRecipesRequest& req);

  longform::editor::v1::ExecuteRecipeResponse ExecuteRecipe(const longform::editor::v1::ExecuteRecipeRequest& req);

  longform::editor::v1::RenderResponse      RenderTimeline(const longform::editor::v1::RenderTimelineRequest& req);
  longform::editor::v1::RenderResponse      RenderScript(const longform::editor::v1::RenderScriptRequest& req);
  longform::editor::v1::RenderResponse      ExecuteAndRender(const longform::editor::v1::ExecuteAndRenderRequest& req);
  longform::editor::v1::RenderResponse      GetRender(const longform::editor::v1::GetRenderRequest& req);
  longform::editor::v1::ListRendersResponse ListRenders(const longform::editor::v1::ListRendersRequest& req);

  longform::editor::v1::ProcessVoiceCommandResponse ProcessVoiceCommand(const longform::editor::v1::ProcessVoiceCommandRequest& req);

  // Never throws.
  longform::editor::v1::HealthResponse Health();

 private:
  ServiceContext ctx_;
};

} // namespace longform::service
