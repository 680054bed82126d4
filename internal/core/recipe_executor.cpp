#include "internal/core/recipe_executor.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/persistence.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace longform::core {

namespace v1 = longform::editor::v1;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr double kEpsilon    = 1e-6;
// Shorter leftovers of a split are discarded.
constexpr double kMinSegment = 1e-3;

struct Overlay {
  std::string text;
  double      start = 0.0;
  double      end   = 0.0;
};

struct Segment {
  double               start = 0.0;
  double               end   = 0.0;
  double               speed = 1.0;
  std::vector<Overlay> overlays;

  double OutputDuration() const {
    return (end - start) / speed;
  }
};

// Copy of seg restricted to [start, end], overlays clipped.
Segment Slice(const Segment& seg, double start, double end) {
  Segment out;
  out.start = start;
  out.end   = end;
  out.speed = seg.speed;
  for (const auto& overlay : seg.overlays) {
    const double s = std::max(overlay.start, start);
    const double e = std::min(overlay.end, end);
    if (e - s > kEpsilon) {
      out.overlays.push_back({overlay.text, s, e});
    }
  }
  return out;
}

class SegmentList {
 public:
  explicit SegmentList(double duration) {
    if (duration > kEpsilon) {
      segments_.push_back({0.0, duration, 1.0, {}});
    }
  }

  // Removes [start, end] of source time. Returns the removed length.
  double Cut(double start, double end) {
    double               removed = 0.0;
    std::vector<Segment> next;
    next.reserve(segments_.size() + 1);

    for (const auto& seg : segments_) {
      const double s = std::max(seg.start, start);
      const double e = std::min(seg.end, end);
      if (e - s <= kEpsilon) {
        next.push_back(seg);
        continue;
      }
      removed += e - s;
      if (s - seg.start >= kMinSegment) {
        next.push_back(Slice(seg, seg.start, s));
      }
      if (seg.end - e >= kMinSegment) {
        next.push_back(Slice(seg, e, seg.end));
      }
    }

    segments_ = std::move(next);
    return removed;
  }

  // Removes output time from the front (head) or back (tail).
  void TrimHead(double seconds) {
    while (seconds > kEpsilon && !segments_.empty()) {
      auto& seg = segments_.front();
      if (seg.OutputDuration() <= seconds + kEpsilon) {
        seconds -= seg.OutputDuration();
        segments_.erase(segments_.begin());
        continue;
      }
      seg = Slice(seg, seg.start + seconds * seg.speed, seg.end);
      seconds = 0;
    }
  }

  void TrimTail(double seconds) {
    while (seconds > kEpsilon && !segments_.empty()) {
      auto& seg = segments_.back();
      if (seg.OutputDuration() <= seconds + kEpsilon) {
        seconds -= seg.OutputDuration();
        segments_.pop_back();
        continue;
      }
      seg = Slice(seg, seg.start, seg.end - seconds * seg.speed);
      seconds = 0;
    }
  }

  // Splits segments at the range boundaries and applies fn to every piece
  // inside it. Returns how many pieces were touched.
  template <typename Fn>
  int ForEachInRange(double start, double end, Fn fn) {
    int                  touched = 0;
    std::vector<Segment> next;
    next.reserve(segments_.size() + 2);

    for (const auto& seg : segments_) {
      const double s = std::max(seg.start, start);
      const double e = std::min(seg.end, end);
      if (e - s <= kEpsilon) {
        next.push_back(seg);
        continue;
      }
      if (s - seg.start >= kMinSegment) {
        next.push_back(Slice(seg, seg.start, s));
      }
      auto inner = Slice(seg, s, e);
      fn(inner);
      next.push_back(std::move(inner));
      ++touched;
      if (seg.end - e >= kMinSegment) {
        next.push_back(Slice(seg, e, seg.end));
      }
    }

    segments_ = std::move(next);
    return touched;
  }

  std::vector<Segment>& Segments() {
    return segments_;
  }

  double OutputDuration() const {
    double total = 0.0;
    for (const auto& seg : segments_) {
      total += seg.OutputDuration();
    }
    return total;
  }

 private:
  std::vector<Segment> segments_;
};

struct TimeSpan {
  double start;
  double end;
};

TimeSpan ResolveWords(const v1::Transcript& transcript, const v1::WordRange& range) {
  const auto count = static_cast<uint32_t>(transcript.words_size());
  if (range.begin() >= range.end() || range.end() > count) {
    throw util::ExecutionError("word range [" + std::to_string(range.begin()) + ", " + std::to_string(range.end()) +
                               ") is outside the transcript (" + std::to_string(count) + " words)");
  }
  return {transcript.words(static_cast<int>(range.begin())).start_seconds(), transcript.words(static_cast<int>(range.end() - 1)).end_seconds()};
}

void CheckRange(const v1::TimeRange& range, const char* op) {
  if (!(range.end_seconds() > range.start_seconds())) {
    throw util::ExecutionError(std::string(op) + ": empty time range");
  }
}

void ApplyCut(SegmentList& timeline, const v1::CutOperation& cut, const v1::Transcript& transcript) {
  double removed = 0.0;
  if (cut.words_size() > 0) {
    for (const auto& words : cut.words()) {
      auto span = ResolveWords(transcript, words);
      removed += timeline.Cut(span.start, span.end);
    }
  } else {
    CheckRange(cut.range(), "cut");
    removed = timeline.Cut(cut.range().start_seconds(), cut.range().end_seconds());
  }
  if (removed <= kEpsilon) {
    throw util::ExecutionError("cut: target is not part of the retained material");
  }
}

void ApplyTrim(SegmentList& timeline, const v1::TrimOperation& trim) {
  if (trim.head_seconds() < 0 || trim.tail_seconds() < 0) {
    throw util::ExecutionError("trim: negative duration");
  }
  if (trim.head_seconds() + trim.tail_seconds() >= timeline.OutputDuration() - kEpsilon) {
    throw util::ExecutionError("trim: would remove the entire timeline");
  }
  timeline.TrimHead(trim.head_seconds());
  timeline.TrimTail(trim.tail_seconds());
}

void ApplyReorder(SegmentList& timeline, const v1::ReorderOperation& reorder) {
  auto&       segments = timeline.Segments();
  const auto  count    = static_cast<int64_t>(segments.size());
  const auto  from     = static_cast<int64_t>(reorder.from_position());
  const int64_t to     = reorder.to_position() == -1 ? count - 1 : reorder.to_position();

  if (from >= count || to < 0 || to >= count) {
    throw util::ExecutionError("reorder: position out of range (" + std::to_string(count) + " segments)");
  }

  auto moved = std::move(segments[static_cast<std::size_t>(from)]);
  segments.erase(segments.begin() + from);
  segments.insert(segments.begin() + to, std::move(moved));
}

void ApplyOverlay(SegmentList& timeline, const v1::OverlayOperation& overlay) {
  CheckRange(overlay.range(), "overlay");
  const double start   = overlay.range().start_seconds();
  const double end     = overlay.range().end_seconds();
  int          touched = 0;
  for (auto& seg : timeline.Segments()) {
    const double s = std::max(seg.start, start);
    const double e = std::min(seg.end, end);
    if (e - s > kEpsilon) {
      seg.overlays.push_back({overlay.text(), s, e});
      ++touched;
    }
  }
  if (touched == 0) {
    throw util::ExecutionError("overlay: range is not part of the retained material");
  }
}

void ApplyRemoveSilence(SegmentList& timeline, const v1::RemoveSilenceOperation& silence, const v1::Transcript& transcript) {
  if (silence.min_gap_seconds() <= 0) {
    throw util::ExecutionError("remove_silence: min_gap_seconds must be positive");
  }
  if (transcript.words_size() == 0) {
    return;
  }

  const double padding = std::max(0.0, silence.padding_seconds());
  auto         cut_gap = [&](double start, double end) {
    if (end - start >= silence.min_gap_seconds()) {
      const double s = start + padding;
      const double e = end - padding;
      if (e - s > kEpsilon) {
        timeline.Cut(s, e);
      }
    }
  };

  double cursor = 0.0;
  for (const auto& word : transcript.words()) {
    cut_gap(cursor, word.start_seconds());
    cursor = std::max(cursor, word.end_seconds());
  }
  cut_gap(cursor, transcript.duration_seconds());
}

void ApplyRemoveFillers(SegmentList& timeline, const v1::RemoveFillersOperation& fillers, const v1::Transcript& transcript) {
  for (const auto& words : fillers.words()) {
    auto span = ResolveWords(transcript, words);
    timeline.Cut(span.start, span.end);
  }
}

void ApplyPacing(SegmentList& timeline, const v1::AdjustPacingOperation& pacing) {
  if (!(pacing.speed() > 0)) {
    throw util::ExecutionError("adjust_pacing: speed must be positive");
  }

  if (!pacing.has_range()) {
    for (auto& seg : timeline.Segments()) {
      seg.speed = pacing.speed();
    }
    return;
  }

  CheckRange(pacing.range(), "adjust_pacing");
  const int touched = timeline.ForEachInRange(pacing.range().start_seconds(), pacing.range().end_seconds(),
                                              [&](Segment& seg) { seg.speed = pacing.speed(); });
  if (touched == 0) {
    throw util::ExecutionError("adjust_pacing: range is not part of the retained material");
  }
}

double SourceDuration(const v1::Transcript& transcript) {
  double duration = transcript.duration_seconds();
  for (const auto& word : transcript.words()) {
    duration = std::max(duration, word.end_seconds());
  }
  return duration;
}

} // namespace

v1::EditTimeline ExecuteRecipe(const v1::EditRecipe& recipe, const v1::Transcript& transcript) {
  const double source_duration = SourceDuration(transcript);
  SegmentList  timeline(source_duration);

  for (int i = 0; i < recipe.operations_size(); ++i) {
    const auto& op = recipe.operations(i);
    try {
      switch (op.op_case()) {
        case v1::EditOperation::kCut:
          ApplyCut(timeline, op.cut(), transcript);
          break;
        case v1::EditOperation::kTrim:
          ApplyTrim(timeline, op.trim());
          break;
        case v1::EditOperation::kReorder:
          ApplyReorder(timeline, op.reorder());
          break;
        case v1::EditOperation::kOverlay:
          ApplyOverlay(timeline, op.overlay());
          break;
        case v1::EditOperation::kRemoveSilence:
          ApplyRemoveSilence(timeline, op.remove_silence(), transcript);
          break;
        case v1::EditOperation::kRemoveFillers:
          ApplyRemoveFillers(timeline, op.remove_fillers(), transcript);
          break;
        case v1::EditOperation::kAdjustPacing:
          ApplyPacing(timeline, op.adjust_pacing());
          break;
        case v1::EditOperation::OP_NOT_SET:
          throw util::ExecutionError("operation has no type");
      }
    } catch (const util::ExecutionError& e) {
      throw util::ExecutionError("operation " + std::to_string(i) + ": " + e.what());
    }
  }

  v1::EditTimeline out;
  out.set_recipe_id(recipe.id());
  out.set_transcript_id(transcript.id());
  out.set_source_asset_url(transcript.asset_url());
  out.set_source_duration_seconds(source_duration);
  out.set_output_duration_seconds(timeline.OutputDuration());

  uint32_t order = 0;
  for (const auto& seg : timeline.Segments()) {
    auto* segment = out.add_segments();
    segment->set_source_start_seconds(seg.start);
    segment->set_source_end_seconds(seg.end);
    segment->set_output_order(order++);

    if (std::abs(seg.speed - 1.0) > kEpsilon || !seg.overlays.empty()) {
      auto* transform = segment->mutable_transform();
      transform->set_speed(seg.speed);
      for (const auto& overlay : seg.overlays) {
        auto* o = transform->add_overlays();
        o->set_text(overlay.text);
        o->set_source_start_seconds(overlay.start);
        o->set_source_end_seconds(overlay.end);
      }
    }
  }
  return out;
}

RecipeExecutor::RecipeExecutor(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

v1::EditTimeline RecipeExecutor::Execute(const std::string& recipe_id, const std::string& transcript_id) {
  if (recipe_id.empty()) {
    throw util::InvalidInput("recipeId is required");
  }
  if (transcript_id.empty()) {
    throw util::InvalidInput("transcriptId is required");
  }

  std::optional<db::model::RecipeRecord>     recipe_record;
  std::optional<db::model::TranscriptRecord> transcript_record;
  {
    auto tx           = repository_->Begin();
    recipe_record     = repository_->GetRecipe(*tx, recipe_id);
    transcript_record = repository_->GetTranscript(*tx, transcript_id);
    tx->Commit();
  }

  if (!recipe_record) {
    throw util::RecipeNotFound("recipe not found: " + recipe_id);
  }
  if (!transcript_record) {
    throw util::TranscriptNotFound("transcript not found: " + transcript_id);
  }

  const auto recipe     = FromRecord(*recipe_record);
  const auto transcript = FromRecord(*transcript_record);

  if (!recipe.transcript_id().empty() && recipe.transcript_id() != transcript_id) {
    LONGFORM_LOG_WARN("executing recipe against a different transcript",
                      {StringField("recipe_id", recipe_id), StringField("compiled_against", recipe.transcript_id()),
                       StringField("transcript_id", transcript_id)});
  }

  auto timeline = ExecuteRecipe(recipe, transcript);

  LONGFORM_LOG_INFO("recipe executed", {StringField("recipe_id", recipe_id), StringField("transcript_id", transcript_id),
                                        IntField("segments", timeline.segments_size()),
                                        DoubleField("output_duration_seconds", timeline.output_duration_seconds())});
  return timeline;
}

} // namespace longform::core
