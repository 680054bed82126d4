#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>
#include <string>

#include "longform/editor/v1.hpp"

namespace longform::providers {

/*
  Speech-to-text collaborator.

  Transcribe() throws util::CollaboratorTimeout when the deadline passes
  and util::CollaboratorError on any other failure.
*/
class TranscriptionProvider {
 public:
  virtual ~TranscriptionProvider() = default;

  virtual longform::editor::v1::TranscribeResponse Transcribe(const std::string& media_url) = 0;

  // Never throws.
  virtual bool Healthy() = 0;
};

class GrpcTranscriptionProvider final : public TranscriptionProvider {
 public:
  GrpcTranscriptionProvider(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout);

  longform::editor::v1::TranscribeResponse Transcribe(const std::string& media_url) override;
  bool                                     Healthy() override;

 private:
  std::unique_ptr<longform::editor::v1::TranscriptionProvider::Stub> stub_;
  std::chrono::milliseconds                                           timeout_;
};

} // namespace longform::providers
