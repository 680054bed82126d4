#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/core/recipe_executor.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/providers/render_provider.hpp"
#include "longform/editor/v1.hpp"

namespace longform::core {

struct RenderSettings {
  // Attempts per submission; only collaborator timeouts are retried.
  uint32_t submit_attempts = 3;
  // Non-terminal renders older than this fail on the next poll. 0 disables.
  uint64_t job_timeout_ms = 0;

  longform::editor::v1::RenderProfile preview_profile = DefaultProfile(longform::editor::v1::RENDER_QUALITY_PREVIEW);
  longform::editor::v1::RenderProfile final_profile   = DefaultProfile(longform::editor::v1::RENDER_QUALITY_FINAL);

  static longform::editor::v1::RenderProfile DefaultProfile(longform::editor::v1::RenderQuality quality);
};

struct RenderOptions {
  longform::editor::v1::RenderQuality quality = longform::editor::v1::RENDER_QUALITY_PREVIEW;
  std::optional<std::string>          recipe_id;
  std::optional<std::string>          deliverable_id;
  std::string                         task_id;
  // Empty selects 16:9.
  std::string aspect_ratio;
};

/*
  RenderOrchestrator

  Submits timelines or scripts to the render collaborator and tracks the
  resulting jobs.

  - Nothing is persisted for a rejected submission.
  - Submission timeouts are retried; exhausting them persists a FAILED
    render (submit_timeout) and throws util::RenderTimeout.
  - GetStatus() polls the collaborator for non-terminal renders and
    persists the observed transition. Terminal renders are pure reads.
  - Polls of one render are serialized in process and fenced by
    row_version in storage.
*/
class RenderOrchestrator {
 public:
  RenderOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<providers::RenderProvider> provider,
                     std::shared_ptr<RecipeExecutor> executor, RenderSettings settings);

  longform::editor::v1::Render RenderTimeline(const longform::editor::v1::EditTimeline& timeline, const RenderOptions& options);
  longform::editor::v1::Render RenderScript(const std::string& script_text, const RenderOptions& options);
  longform::editor::v1::Render ExecuteAndRender(const std::string& recipe_id, const std::string& transcript_id, RenderOptions options);

  // Throws util::RenderNotFound.
  longform::editor::v1::Render GetStatus(const std::string& render_id);

  // Newest first, at most 50.
  std::vector<longform::editor::v1::Render> List(const std::optional<std::string>&                         deliverable_id,
                                                 const std::optional<longform::editor::v1::RenderQuality>& kind);

  static std::string_view QualityName(longform::editor::v1::RenderQuality quality);

  // Renders with a status poll running or waiting.
  std::size_t ActivePolls() const;

 private:
  struct Prepared {
    longform::editor::v1::SubmitRenderRequest request;
    longform::editor::v1::RenderMetrics       metrics;
  };

  void                         Validate(RenderOptions& options) const;
  longform::editor::v1::Render Submit(Prepared prepared, const RenderOptions& options);
  longform::editor::v1::Render Reconcile(db::model::RenderRecord record);

  db::model::RenderRecord      Load(const std::string& render_id);
  std::shared_ptr<std::mutex>  RenderMutex(const std::string& render_id);
  // Drops the caller's reference; the entry goes once nobody else holds it.
  void                         ReleaseRenderMutex(const std::string& render_id, std::shared_ptr<std::mutex> mutex);

  std::shared_ptr<db::Repository>           repository_;
  std::shared_ptr<providers::RenderProvider> provider_;
  std::shared_ptr<RecipeExecutor>            executor_;
  RenderSettings                             settings_;

  mutable std::mutex                                           render_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> render_mutexes_;
};

} // namespace longform::core
