#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>
#include <string>

#include "longform/editor/v1.hpp"

namespace longform::providers {

/*
  Render / video generation collaborator.

  Submit() returns the provider job id. A rejected submission throws
  util::CollaboratorError, an expired deadline util::CollaboratorTimeout.
  Poll() follows the same convention.
*/
class RenderProvider {
 public:
  virtual ~RenderProvider() = default;

  virtual std::string Submit(const longform::editor::v1::SubmitRenderRequest& request) = 0;

  virtual longform::editor::v1::PollRenderResponse Poll(const std::string& job_id) = 0;

  // Never throws.
  virtual bool Healthy() = 0;
};

class GrpcRenderProvider final : public RenderProvider {
 public:
  GrpcRenderProvider(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds submit_timeout, std::chrono::milliseconds poll_timeout);

  std::string                              Submit(const longform::editor::v1::SubmitRenderRequest& request) override;
  longform::editor::v1::PollRenderResponse Poll(const std::string& job_id) override;
  bool                                     Healthy() override;

 private:
  std::unique_ptr<longform::editor::v1::RenderProvider::Stub> stub_;
  std::chrono::milliseconds                                    submit_timeout_;
  std::chrono::milliseconds                                    poll_timeout_;
};

} // namespace longform::providers
