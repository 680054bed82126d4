#pragma once

#include <cstdint>
#include <string>

namespace longform::db::model {

/*
  Persisted transcript. Words and meta are stored as protobuf JSON text.
*/
struct TranscriptRecord {
  std::string id;
  std::string deliverable_id;
  std::string asset_url;
  std::string words_json;
  std::string full_text;
  double      duration_seconds = 0.0;
  std::string meta_json;
  uint64_t    created_at_ms = 0;
};

} // namespace longform::db::model
