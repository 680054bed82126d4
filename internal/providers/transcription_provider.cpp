#include "internal/providers/transcription_provider.hpp"

#include "internal/providers/call_status.hpp"

namespace longform::providers {

namespace v1 = longform::editor::v1;

GrpcTranscriptionProvider::GrpcTranscriptionProvider(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout)
    : stub_(v1::TranscriptionProvider::NewStub(std::move(channel))), timeout_(timeout) {
}

v1::TranscribeResponse GrpcTranscriptionProvider::Transcribe(const std::string& media_url) {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, timeout_);

  v1::TranscribeRequest req;
  req.set_media_url(media_url);

  v1::TranscribeResponse resp;
  ThrowIfFailed(stub_->Transcribe(&ctx, req, &resp), "Transcribe");
  return resp;
}

bool GrpcTranscriptionProvider::Healthy() {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, timeout_);

  v1::ProviderHealthResponse resp;
  auto                       status = stub_->Health(&ctx, v1::ProviderHealthRequest{}, &resp);
  return status.ok() && resp.healthy();
}

} // namespace longform::providers
