#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/providers/transcription_provider.hpp"
#include "longform/editor/v1.hpp"

namespace longform::core {

/*
  TranscriptStore

  Runs the transcription collaborator and persists its result as an
  immutable Transcript. One write per Transcribe() call; repeated calls
  for the same asset create distinct transcripts.
*/
class TranscriptStore {
 public:
  TranscriptStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<providers::TranscriptionProvider> provider);

  longform::editor::v1::Transcript Transcribe(const std::string& asset_url, const std::optional<std::string>& deliverable_id);

  // Throws util::TranscriptNotFound.
  longform::editor::v1::Transcript Get(const std::string& id);

  // Canonical word list: trimmed, empty words dropped, stable sorted by
  // start, end clamped to start.
  static longform::editor::v1::Transcript Normalize(const longform::editor::v1::TranscribeResponse& response);

 private:
  std::shared_ptr<db::Repository>                  repository_;
  std::shared_ptr<providers::TranscriptionProvider> provider_;
};

} // namespace longform::core
