#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/editing_service.hpp"
#include "longform/editor/v1.hpp"

namespace longform::grpc {

class EditingServer final : public longform::editor::v1::LongformEditingService::Service {
 public:
  explicit EditingServer(std::shared_ptr<longform::service::EditingService> svc);

  ::grpc::Status CreateTranscript(::grpc::ServerContext*, const longform::editor::v1::CreateTranscriptRequest*, longform::editor::v1::CreateTranscriptResponse*) override;
  ::grpc::Status GetTranscript(::grpc::ServerContext*, const longform::editor::v1::GetTranscriptRequest*, longform::editor::v1::GetTranscriptResponse*) override;
  ::grpc::Status CompileRecipe(::grpc::ServerContext*, const longform::editor::v1::CompileRecipeRequest*, longform::editor::v1::CompileRecipeResponse*) override;
  ::grpc::Status ExtendRecipe(::grpc::ServerContext*, const longform::editor::v1::ExtendRecipeRequest*, longform::editor::v1::CompileRecipeResponse*) override;
  ::grpc::Status GetRecipe(::grpc::ServerContext*, const longform::editor::v1::GetRecipeRequest*, longform::editor::v1::GetRecipeResponse*) override;
  ::grpc::Status ListRecipes(::grpc::ServerContext*, const longform::editor::v1::ListRecipesRequest*, longform::editor::v1::ListRecipesResponse*) override;
  ::grpc::Status ExecuteRecipe(::grpc::ServerContext*, const longform::editor::v1::ExecuteRecipeRequest*, longform::editor::v1::ExecuteRecipeResponse*) override;
  ::grpc::Status RenderTimeline(::grpc::ServerContext*, const longform::editor::v1::RenderTimelineRequest*, longform::editor::v1::RenderResponse*) override;
  ::grpc::Status RenderScript(::grpc::ServerContext*, const longform::editor::v1::RenderScriptRequest*, longform::editor::v1::RenderResponse*) override;
  ::grpc::Status ExecuteAndRender(::grpc::ServerContext*, const longform::editor::v1::ExecuteAndRenderRequest*, longform::editor::v1::RenderResponse*) override;
  ::grpc::Status GetRender(::grpc::ServerContext*, const longform::editor::v1::GetRenderRequest*, longform::editor::v1::RenderResponse*) override;
  ::grpc::Status ListRenders(::grpc::ServerContext*, const longform::editor::v1::ListRendersRequest*, longform::editor::v1::ListRendersResponse*) override;
  ::grpc::Status ProcessVoiceCommand(::grpc::ServerContext*, const longform::editor::v1::ProcessVoiceCommandRequest*, longform::editor::v1::ProcessVoiceCommandResponse*) override;
  ::grpc::Status Health(::grpc::ServerContext*, const longform::editor::v1::HealthRequest*, longform::editor::v1::HealthResponse*) override;

 private:
  std::shared_ptr<longform::service::EditingService> service_;
};

} // namespace longform::grpc
