#include "editing_server.hpp"

#include "grpc_error.hpp"

namespace longform::grpc {

EditingServer::EditingServer(std::shared_ptr<longform::service::EditingService> svc) : service_(std::move(svc)) {
}

::grpc::Status EditingServer::CreateTranscript(::grpc::ServerContext*, const longform::editor::v1::CreateTranscriptRequest* req, longform::editor::v1::CreateTranscriptResponse* resp) {
  try {
    *resp = service_->CreateTranscript(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EditingServer::GetTranscript(::grpc::ServerContext*, const longform::editor::v1::GetTranscriptRequest* req, longform::editor::v1::GetTranscriptResponse* resp) {
  try {
    *resp = service_->GetTranscript(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EditingServer::CompileRecipe(::grpc::ServerContext*, const longform::editor::v1::CompileRecipeRequest* req, longform::editor::v1::CompileRecipeResponse* resp) {
  try {
    *resp = service_->CompileRecipe(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EditingServer::ExtendRecipe(::grpc::ServerContext*, const longform::editor::v1::ExtendRecipeRequest* req, longform::editor::v1::CompileRecipeResponse* resp) {
  try {
    *resp = service_->ExtendRecipe(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EditingServer::GetRecipe(::grpc::ServerContext*, const longform::editor::v1::GetRecipeRequest* req, longform::editor::v1::GetRecipeResponse* resp) {
  try {
    *resp = service_->GetRecipe(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EditingServer::ListRecipes(::grpc::ServerContext*, const longform::editor::v1::ListRecipesRequest* req, longform::editor::v1::ListRecipesResponse* resp) {
  try {
    *resp = service_->ListRecipes(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EditingServer::ExecuteRecipe(::grpc::ServerContext*, const longform::editor::v1::ExecuteRecipeRequest* req, longform::editor::v1::ExecuteRecipeResponse* resp) {
  try {
    *resp = service_->ExecuteRecipe(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EditingServer::RenderTimeline(::grpc::ServerContext*, const longform::editor::v1::RenderTimelineRequest* req, longform::editor::v1::RenderResponse* resp) {
  try {
    *resp = service_->RenderTimeline(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EditingServer::RenderScript(::grpc::ServerContext*, const longform::editor::v1::RenderScriptRequest* req, longform::editor::v1::RenderResponse* resp) {
  try {
    *resp = service_->RenderScript(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EditingServer::ExecuteAndRender(::grpc::ServerContext*, const longform::editor::v1::ExecuteAndRenderRequest* req, longform::editor::v1::RenderResponse* resp) {
  try {
    *resp = service_->ExecuteAndRender(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EditingServer::GetRender(::grpc::ServerContext*, const longform::editor::v1::GetRenderRequest* req, longform::editor::v1::RenderResponse* resp) {
  try {
    *resp = service_->GetRender(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EditingServer::ListRenders(::grpc::ServerContext*, const longform::editor::v1::ListRendersRequest* req, longform::editor::v1::ListRendersResponse* resp) {
  try {
    *resp = service_->ListRenders(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EditingServer::ProcessVoiceCommand(::grpc::ServerContext*, const longform::editor::v1::ProcessVoiceCommandRequest* req, longform::editor::v1::ProcessVoiceCommandResponse* resp) {
  try {
    *resp = service_->ProcessVoiceCommand(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EditingServer::Health(::grpc::ServerContext*, const longform::editor::v1::HealthRequest*, longform::editor::v1::HealthResponse* resp) {
  try {
    *resp = service_->Health();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace longform::grpc
