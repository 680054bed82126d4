#include "internal/providers/render_provider.hpp"

#include "internal/providers/call_status.hpp"

namespace longform::providers {

namespace v1 = longform::editor::v1;

GrpcRenderProvider::GrpcRenderProvider(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds submit_timeout,
                                       std::chrono::milliseconds poll_timeout)
    : stub_(v1::RenderProvider::NewStub(std::move(channel))), submit_timeout_(submit_timeout), poll_timeout_(poll_timeout) {
}

std::string GrpcRenderProvider::Submit(const v1::SubmitRenderRequest& request) {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, submit_timeout_);

  v1::SubmitRenderResponse resp;
  ThrowIfFailed(stub_->Submit(&ctx, request, &resp), "Submit");
  if (resp.job_id().empty()) {
    throw util::CollaboratorError("empty_job_id", "Submit returned no job id");
  }
  return resp.job_id();
}

v1::PollRenderResponse GrpcRenderProvider::Poll(const std::string& job_id) {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, poll_timeout_);

  v1::PollRenderRequest req;
  req.set_job_id(job_id);

  v1::PollRenderResponse resp;
  ThrowIfFailed(stub_->Poll(&ctx, req, &resp), "Poll");
  return resp;
}

bool GrpcRenderProvider::Healthy() {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, poll_timeout_);

  v1::ProviderHealthResponse resp;
  auto                       status = stub_->Health(&ctx, v1::ProviderHealthRequest{}, &resp);
  return status.ok() && resp.healthy();
}

} // namespace longform::providers
