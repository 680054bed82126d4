#include "internal/core/render_orchestrator.hpp"

#include <algorithm>
#include <array>
#include <chrono>

#include "internal/core/persistence.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace longform::core {

namespace v1 = longform::editor::v1;
using observability::IntField;
using observability::StringField;

namespace {

constexpr std::array<std::string_view, 4> kAspectRatios = {"16:9", "9:16", "1:1", "4:5"};
constexpr std::string_view                kDefaultAspectRatio = "16:9";

v1::RenderStatus ObservedStatus(v1::ProviderJobState state, v1::RenderStatus current) {
  switch (state) {
    case v1::PROVIDER_JOB_STATE_QUEUED:
      return v1::RENDER_STATUS_QUEUED;
    case v1::PROVIDER_JOB_STATE_RUNNING:
      return v1::RENDER_STATUS_RENDERING;
    case v1::PROVIDER_JOB_STATE_SUCCEEDED:
      return v1::RENDER_STATUS_COMPLETED;
    case v1::PROVIDER_JOB_STATE_FAILED:
      return v1::RENDER_STATUS_FAILED;
    default:
      return current;
  }
}

void MarkFailed(v1::Render& render, const std::string& code, const std::string& message) {
  render.set_status(v1::RENDER_STATUS_FAILED);
  render.mutable_metrics()->set_error_code(code);
  render.mutable_metrics()->set_error_message(message);
}

} // namespace

v1::RenderProfile RenderSettings::DefaultProfile(v1::RenderQuality quality) {
  v1::RenderProfile profile;
  if (quality == v1::RENDER_QUALITY_FINAL) {
    profile.set_width(1920);
    profile.set_height(1080);
    profile.set_bitrate_kbps(8000);
  } else {
    profile.set_width(640);
    profile.set_height(360);
    profile.set_bitrate_kbps(1000);
  }
  profile.set_frame_rate(30.0);
  return profile;
}

RenderOrchestrator::RenderOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<providers::RenderProvider> provider,
                                       std::shared_ptr<RecipeExecutor> executor, RenderSettings settings)
    : repository_(std::move(repository)), provider_(std::move(provider)), executor_(std::move(executor)), settings_(std::move(settings)) {
  if (settings_.submit_attempts == 0) {
    settings_.submit_attempts = 1;
  }
}

std::string_view RenderOrchestrator::QualityName(v1::RenderQuality quality) {
  return quality == v1::RENDER_QUALITY_FINAL ? "final" : "preview";
}

void RenderOrchestrator::Validate(RenderOptions& options) const {
  if (options.task_id.empty()) {
    throw util::InvalidInput("taskId is required");
  }
  if (options.aspect_ratio.empty()) {
    options.aspect_ratio = std::string(kDefaultAspectRatio);
  }
  if (std::find(kAspectRatios.begin(), kAspectRatios.end(), options.aspect_ratio) == kAspectRatios.end()) {
    throw util::InvalidInput("unsupported aspect ratio: " + options.aspect_ratio);
  }
  if (options.quality != v1::RENDER_QUALITY_FINAL) {
    options.quality = v1::RENDER_QUALITY_PREVIEW;
  }
}

v1::Render RenderOrchestrator::RenderTimeline(const v1::EditTimeline& timeline, const RenderOptions& options) {
  auto validated = options;
  Validate(validated);
  if (timeline.segments_size() == 0) {
    throw util::InvalidInput("timeline has no segments");
  }
  if (!validated.recipe_id && !timeline.recipe_id().empty()) {
    validated.recipe_id = timeline.recipe_id();
  }

  Prepared prepared;
  *prepared.request.mutable_timeline() = timeline;
  prepared.metrics.set_segment_count(static_cast<uint32_t>(timeline.segments_size()));
  prepared.metrics.set_output_duration_seconds(timeline.output_duration_seconds());
  return Submit(std::move(prepared), validated);
}

v1::Render RenderOrchestrator::RenderScript(const std::string& script_text, const RenderOptions& options) {
  auto validated = options;
  Validate(validated);
  if (script_text.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw util::InvalidInput("scriptText is required");
  }

  Prepared prepared;
  prepared.request.set_script_text(script_text);
  return Submit(std::move(prepared), validated);
}

v1::Render RenderOrchestrator::ExecuteAndRender(const std::string& recipe_id, const std::string& transcript_id, RenderOptions options) {
  Validate(options);

  auto timeline     = executor_->Execute(recipe_id, transcript_id);
  options.recipe_id = recipe_id;

  if (!options.deliverable_id) {
    auto tx     = repository_->Begin();
    auto recipe = repository_->GetRecipe(*tx, recipe_id);
    tx->Commit();
    if (recipe && !recipe->deliverable_id.empty()) {
      options.deliverable_id = recipe->deliverable_id;
    }
  }

  return RenderTimeline(timeline, options);
}

v1::Render RenderOrchestrator::Submit(Prepared prepared, const RenderOptions& options) {
  observability::SpanScope span("RenderOrchestrator.Submit");

  v1::Render render;
  render.set_id(util::NewId());
  render.set_kind(options.quality);
  render.set_task_id(options.task_id);
  render.set_aspect_ratio(options.aspect_ratio);
  if (options.recipe_id) {
    render.set_recipe_id(*options.recipe_id);
  }
  if (options.deliverable_id) {
    render.set_deliverable_id(*options.deliverable_id);
  }

  auto& request = prepared.request;
  request.set_client_reference(render.id());
  request.set_task_id(options.task_id);
  request.set_aspect_ratio(options.aspect_ratio);
  request.set_quality(options.quality);
  *request.mutable_profile() = options.quality == v1::RENDER_QUALITY_FINAL ? settings_.final_profile : settings_.preview_profile;

  const auto  quality = QualityName(options.quality);
  const auto  started = std::chrono::steady_clock::now();
  std::string job_id;
  uint32_t    attempts = 0;

  while (attempts < settings_.submit_attempts) {
    ++attempts;
    try {
      job_id = provider_->Submit(request);
      break;
    } catch (const util::CollaboratorTimeout& e) {
      LONGFORM_LOG_WARN("render submission timed out",
                        {StringField("render_id", render.id()), IntField("attempt", attempts), StringField("error", e.what())});
    } catch (const util::CollaboratorError& e) {
      LONGFORM_LOG_WARN("render submission rejected",
                        {StringField("render_id", render.id()), StringField("code", e.Code()), StringField("error", e.what())});
      span.RecordException(e.what());
      throw util::RenderSubmissionFailed("render provider rejected the submission");
    }
  }

  const auto latency_ms =
      static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
  observability::Metrics::Instance().ObserveRenderSubmitMs(quality, static_cast<double>(latency_ms));

  *render.mutable_metrics() = prepared.metrics;
  render.mutable_metrics()->set_submit_attempts(attempts);
  render.mutable_metrics()->set_submit_latency_ms(latency_ms);
  *render.mutable_created_at() = util::ToProto(util::Now());

  const bool timed_out = job_id.empty();
  if (timed_out) {
    MarkFailed(render, "submit_timeout", "render submission timed out");
    *render.mutable_completed_at() = render.created_at();
  } else {
    render.set_status(v1::RENDER_STATUS_QUEUED);
  }

  auto record            = ToRecord(render);
  record.provider_job_id = job_id;
  {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertRender(*tx, record), "insert render");
    tx->Commit();
  }

  if (timed_out) {
    observability::Metrics::Instance().RecordRenderOutcome(quality, "failed");
    LONGFORM_LOG_ERROR("render submission exhausted retries", {StringField("render_id", render.id()), IntField("attempts", attempts)});
    span.RecordException("submit_timeout");
    throw util::RenderTimeout("render submission timed out after " + std::to_string(attempts) + " attempts");
  }

  span.SetAttribute("render_id", render.id());
  LONGFORM_LOG_INFO("render submitted", {StringField("render_id", render.id()), StringField("job_id", job_id), StringField("quality", quality),
                                         StringField("task_id", options.task_id), IntField("attempts", attempts)});
  return render;
}

db::model::RenderRecord RenderOrchestrator::Load(const std::string& render_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetRender(*tx, render_id);
  tx->Commit();

  if (!record) {
    throw util::RenderNotFound("render not found: " + render_id);
  }
  return *record;
}

std::shared_ptr<std::mutex> RenderOrchestrator::RenderMutex(const std::string& render_id) {
  std::lock_guard<std::mutex> lock(render_mutexes_guard_);
  auto&                       entry = render_mutexes_[render_id];
  if (!entry) {
    entry = std::make_shared<std::mutex>();
  }
  return entry;
}

void RenderOrchestrator::ReleaseRenderMutex(const std::string& render_id, std::shared_ptr<std::mutex> mutex) {
  std::lock_guard<std::mutex> lock(render_mutexes_guard_);
  // every copy is taken and dropped under the guard, so use_count is exact here
  mutex.reset();
  auto it = render_mutexes_.find(render_id);
  if (it != render_mutexes_.end() && it->second.use_count() == 1) {
    render_mutexes_.erase(it);
  }
}

std::size_t RenderOrchestrator::ActivePolls() const {
  std::lock_guard<std::mutex> lock(render_mutexes_guard_);
  return render_mutexes_.size();
}

v1::Render RenderOrchestrator::GetStatus(const std::string& render_id) {
  if (render_id.empty()) {
    throw util::InvalidInput("render id is required");
  }

  // released after the poll lock, on every exit path
  struct Hold {
    RenderOrchestrator*         self;
    const std::string&          id;
    std::shared_ptr<std::mutex> mutex;
    ~Hold() {
      self->ReleaseRenderMutex(id, std::move(mutex));
    }
  } hold{this, render_id, RenderMutex(render_id)};

  std::lock_guard<std::mutex> lock(*hold.mutex);

  auto record = Load(render_id);
  if (model::IsTerminal(record.status)) {
    return FromRecord(record);
  }
  return Reconcile(std::move(record));
}

v1::Render RenderOrchestrator::Reconcile(db::model::RenderRecord record) {
  auto       render  = FromRecord(record);
  const auto current = render.status();
  const auto now_ms  = util::NowMillis();

  if (settings_.job_timeout_ms > 0 && now_ms >= record.created_at_ms + settings_.job_timeout_ms) {
    MarkFailed(render, "render_timeout", "render did not finish within " + std::to_string(settings_.job_timeout_ms) + " ms");
  } else {
    v1::PollRenderResponse poll;
    try {
      poll = provider_->Poll(record.provider_job_id);
    } catch (const util::CollaboratorTimeout& e) {
      LONGFORM_LOG_WARN("render poll timed out", {StringField("render_id", record.id), StringField("error", e.what())});
      throw util::RenderTimeout("render status poll timed out");
    } catch (const util::CollaboratorError& e) {
      // status unknown this round; the next poll tries again
      LONGFORM_LOG_WARN("render poll failed", {StringField("render_id", record.id), StringField("code", e.Code()), StringField("error", e.what())});
      return render;
    }

    auto* metrics = render.mutable_metrics();
    metrics->set_poll_count(metrics->poll_count() + 1);
    if (poll.render_ms() > 0) {
      metrics->set_provider_render_ms(poll.render_ms());
    }
    if (poll.cost_credits() > 0) {
      metrics->set_cost_credits(poll.cost_credits());
    }

    auto next = ObservedStatus(poll.state(), current);
    if (!model::CanTransition(current, next)) {
      LONGFORM_LOG_WARN("ignoring backwards render transition",
                        {StringField("render_id", record.id), IntField("from", current), IntField("to", next)});
      next = current;
    }

    if (next == v1::RENDER_STATUS_COMPLETED && poll.asset_ref().empty()) {
      MarkFailed(render, "missing_asset", "render completed without an asset reference");
    } else if (next == v1::RENDER_STATUS_FAILED) {
      MarkFailed(render, poll.error().code().empty() ? "provider_failed" : poll.error().code(),
                 poll.error().message().empty() ? "render failed" : poll.error().message());
    } else {
      render.set_status(next);
      if (next == v1::RENDER_STATUS_COMPLETED) {
        render.set_asset_id(poll.asset_ref());
      }
    }
  }

  if (model::IsTerminal(render.status())) {
    *render.mutable_completed_at() = util::ToProto(util::FromUnixMillis(now_ms));
  }

  auto updated            = ToRecord(render);
  updated.provider_job_id = record.provider_job_id;
  try {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->UpdateRender(*tx, updated, record.row_version), "update render");
    tx->Commit();
  } catch (const util::Conflict&) {
    // another process reconciled first; its write wins
    LONGFORM_LOG_DEBUG("render update lost the race", {StringField("render_id", record.id)});
    return FromRecord(Load(record.id));
  }

  if (render.status() != current) {
    LONGFORM_LOG_INFO("render status changed", {StringField("render_id", render.id()), StringField("from", v1::RenderStatus_Name(current)),
                                                StringField("to", v1::RenderStatus_Name(render.status()))});
    if (model::IsTerminal(render.status())) {
      observability::Metrics::Instance().RecordRenderOutcome(QualityName(render.kind()),
                                                             render.status() == v1::RENDER_STATUS_COMPLETED ? "completed" : "failed");
    }
  }
  return render;
}

std::vector<v1::Render> RenderOrchestrator::List(const std::optional<std::string>& deliverable_id, const std::optional<v1::RenderQuality>& kind) {
  db::model::RenderFilter filter;
  filter.deliverable_id = deliverable_id;
  filter.kind           = kind;

  auto tx      = repository_->Begin();
  auto records = repository_->ListRenders(*tx, filter);
  tx->Commit();

  std::vector<v1::Render> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(FromRecord(record));
  }
  return out;
}

} // namespace longform::core
