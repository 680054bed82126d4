#include "internal/core/persistence.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace longform::core {

namespace v1 = longform::editor::v1;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::Conflict:
    case db::ErrorCode::ConstraintViolation:
    case db::ErrorCode::SerializationFailure:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message);
  }
}

std::string ToJson(const google::protobuf::Message& message) {
  std::string                               json;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  if (json.empty()) {
    return;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error("corrupt stored " + message->GetTypeName() + ": " + std::string(status.message()));
  }
}

// ------------------------------------------------------------------
// Transcript
// ------------------------------------------------------------------

db::model::TranscriptRecord ToRecord(const v1::Transcript& transcript) {
  v1::WordList words;
  *words.mutable_words() = transcript.words();

  db::model::TranscriptRecord record;
  record.id               = transcript.id();
  record.deliverable_id   = transcript.deliverable_id();
  record.asset_url        = transcript.asset_url();
  record.words_json       = ToJson(words);
  record.full_text        = transcript.full_text();
  record.duration_seconds = transcript.duration_seconds();
  record.meta_json        = ToJson(transcript.meta());
  record.created_at_ms    = util::ToUnixMillis(util::FromProto(transcript.created_at()));
  return record;
}

v1::Transcript FromRecord(const db::model::TranscriptRecord& record) {
  v1::WordList words;
  FromJson(record.words_json, &words);

  v1::Transcript transcript;
  transcript.set_id(record.id);
  transcript.set_deliverable_id(record.deliverable_id);
  transcript.set_asset_url(record.asset_url);
  *transcript.mutable_words() = std::move(*words.mutable_words());
  transcript.set_full_text(record.full_text);
  transcript.set_duration_seconds(record.duration_seconds);
  FromJson(record.meta_json, transcript.mutable_meta());
  *transcript.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
  return transcript;
}

// ------------------------------------------------------------------
// Recipe
// ------------------------------------------------------------------

db::model::RecipeRecord ToRecord(const v1::EditRecipe& recipe) {
  v1::OperationList operations;
  *operations.mutable_operations() = recipe.operations();

  db::model::RecipeRecord record;
  record.id                = recipe.id();
  record.deliverable_id    = recipe.deliverable_id();
  record.transcript_id     = recipe.transcript_id();
  record.instructions      = recipe.instructions();
  record.operations_json   = ToJson(operations);
  record.version           = recipe.version();
  record.compiler_revision = recipe.compiler_revision();
  record.created_at_ms     = util::ToUnixMillis(util::FromProto(recipe.created_at()));
  return record;
}

v1::EditRecipe FromRecord(const db::model::RecipeRecord& record) {
  v1::OperationList operations;
  FromJson(record.operations_json, &operations);

  v1::EditRecipe recipe;
  recipe.set_id(record.id);
  recipe.set_deliverable_id(record.deliverable_id);
  recipe.set_transcript_id(record.transcript_id);
  recipe.set_instructions(record.instructions);
  recipe.set_version(record.version);
  *recipe.mutable_operations() = std::move(*operations.mutable_operations());
  recipe.set_compiler_revision(record.compiler_revision);
  *recipe.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
  return recipe;
}

// ------------------------------------------------------------------
// Render
// ------------------------------------------------------------------

db::model::RenderRecord ToRecord(const v1::Render& render) {
  db::model::RenderRecord record;
  record.id             = render.id();
  record.deliverable_id = render.deliverable_id();
  record.recipe_id      = render.recipe_id();
  record.kind           = render.kind();
  record.status         = render.status();
  record.task_id        = render.task_id();
  record.aspect_ratio   = render.aspect_ratio();
  record.asset_id       = render.asset_id();
  record.metrics_json   = ToJson(render.metrics());
  record.created_at_ms  = util::ToUnixMillis(util::FromProto(render.created_at()));
  if (render.has_completed_at()) {
    record.completed_at_ms = util::ToUnixMillis(util::FromProto(render.completed_at()));
  }
  return record;
}

v1::Render FromRecord(const db::model::RenderRecord& record) {
  v1::Render render;
  render.set_id(record.id);
  render.set_deliverable_id(record.deliverable_id);
  render.set_recipe_id(record.recipe_id);
  render.set_kind(record.kind);
  render.set_status(record.status);
  render.set_task_id(record.task_id);
  render.set_aspect_ratio(record.aspect_ratio);
  render.set_asset_id(record.asset_id);
  FromJson(record.metrics_json, render.mutable_metrics());
  *render.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
  if (record.completed_at_ms) {
    *render.mutable_completed_at() = util::ToProto(util::FromUnixMillis(*record.completed_at_ms));
  }
  return render;
}

} // namespace longform::core
