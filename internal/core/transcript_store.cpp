#include "internal/core/transcript_store.hpp"

#include <algorithm>
#include <cctype>

#include "internal/core/persistence.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace longform::core {

namespace v1 = longform::editor::v1;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

std::string Trim(const std::string& s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  auto end   = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return begin < end ? std::string(begin, end) : std::string{};
}

} // namespace

TranscriptStore::TranscriptStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<providers::TranscriptionProvider> provider)
    : repository_(std::move(repository)), provider_(std::move(provider)) {
}

v1::Transcript TranscriptStore::Normalize(const v1::TranscribeResponse& response) {
  v1::Transcript transcript;

  for (const auto& in : response.words()) {
    auto text = Trim(in.text());
    if (text.empty()) {
      continue;
    }

    auto* word = transcript.add_words();
    word->set_text(std::move(text));
    word->set_start_seconds(std::max(0.0, in.start_seconds()));
    word->set_end_seconds(std::max(word->start_seconds(), in.end_seconds()));
    if (!in.speaker().empty()) {
      word->set_speaker_id(in.speaker());
    }
  }

  std::stable_sort(transcript.mutable_words()->begin(), transcript.mutable_words()->end(),
                   [](const v1::Word& a, const v1::Word& b) { return a.start_seconds() < b.start_seconds(); });

  std::string full_text;
  double      last_end = 0.0;
  for (const auto& word : transcript.words()) {
    if (!full_text.empty()) {
      full_text.push_back(' ');
    }
    full_text += word.text();
    last_end = std::max(last_end, word.end_seconds());
  }

  transcript.set_full_text(std::move(full_text));
  transcript.set_duration_seconds(response.duration_seconds() > 0 ? response.duration_seconds() : last_end);
  *transcript.mutable_meta() = response.meta();
  return transcript;
}

v1::Transcript TranscriptStore::Transcribe(const std::string& asset_url, const std::optional<std::string>& deliverable_id) {
  if (asset_url.empty()) {
    throw util::InvalidInput("assetUrl is required");
  }

  v1::TranscribeResponse response;
  try {
    response = provider_->Transcribe(asset_url);
  } catch (const util::CollaboratorTimeout& e) {
    LONGFORM_LOG_WARN("transcription timed out", {StringField("asset_url", asset_url), StringField("error", e.what())});
    throw util::TranscriptionFailed("transcription timed out");
  } catch (const util::CollaboratorError& e) {
    LONGFORM_LOG_WARN("transcription failed", {StringField("asset_url", asset_url), StringField("error", e.what())});
    throw util::TranscriptionFailed("transcription provider error");
  }

  auto transcript = Normalize(response);
  transcript.set_id(util::NewId());
  transcript.set_asset_url(asset_url);
  if (deliverable_id) {
    transcript.set_deliverable_id(*deliverable_id);
  }
  *transcript.mutable_created_at() = util::ToProto(util::Now());

  {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertTranscript(*tx, ToRecord(transcript)), "insert transcript");
    tx->Commit();
  }

  LONGFORM_LOG_INFO("transcript created", {StringField("transcript_id", transcript.id()), IntField("words", transcript.words_size()),
                                           DoubleField("duration_seconds", transcript.duration_seconds())});
  return transcript;
}

v1::Transcript TranscriptStore::Get(const std::string& id) {
  if (id.empty()) {
    throw util::InvalidInput("transcript id is required");
  }

  auto tx     = repository_->Begin();
  auto record = repository_->GetTranscript(*tx, id);
  tx->Commit();

  if (!record) {
    throw util::TranscriptNotFound("transcript not found: " + id);
  }
  return FromRecord(*record);
}

} // namespace longform::core
