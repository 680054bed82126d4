#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/model/recipe_record.hpp"
#include "internal/db/model/render_record.hpp"
#include "internal/db/model/transcript_record.hpp"
#include "longform/editor/v1.hpp"

namespace longform::core {

/*
  Record <-> wire conversion plus repository error translation.

  Nested data (words, operations, metrics, meta) is stored as protobuf
  JSON text. A row that fails to decode is treated as corruption.
*/

// Maps a failed repository Result onto the pipeline error kinds.
void ThrowIfDbError(const db::Result& result, const std::string& context);

db::model::TranscriptRecord          ToRecord(const longform::editor::v1::Transcript& transcript);
longform::editor::v1::Transcript     FromRecord(const db::model::TranscriptRecord& record);

db::model::RecipeRecord              ToRecord(const longform::editor::v1::EditRecipe& recipe);
longform::editor::v1::EditRecipe     FromRecord(const db::model::RecipeRecord& record);

db::model::RenderRecord              ToRecord(const longform::editor::v1::Render& render);
longform::editor::v1::Render         FromRecord(const db::model::RenderRecord& record);

std::string ToJson(const google::protobuf::Message& message);
void        FromJson(const std::string& json, google::protobuf::Message* message);

} // namespace longform::core
