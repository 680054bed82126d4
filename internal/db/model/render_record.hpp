#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "longform/editor/v1.hpp"

namespace longform::db::model {

struct RenderRecord {
  std::string id;
  std::string deliverable_id;
  std::string recipe_id;

  longform::editor::v1::RenderQuality kind   = longform::editor::v1::RENDER_QUALITY_UNSPECIFIED;
  longform::editor::v1::RenderStatus  status = longform::editor::v1::RENDER_STATUS_UNSPECIFIED;

  std::string task_id;
  std::string aspect_ratio;
  std::string provider_job_id;
  std::string asset_id;
  std::string metrics_json;

  // bumped on every successful update, used to fence concurrent pollers
  uint64_t row_version = 0;

  uint64_t                created_at_ms = 0;
  std::optional<uint64_t> completed_at_ms;
};

struct RenderFilter {
  std::optional<std::string>                         deliverable_id;
  std::optional<longform::editor::v1::RenderQuality> kind;
  uint32_t                                           limit = 50;
};

} // namespace longform::db::model
