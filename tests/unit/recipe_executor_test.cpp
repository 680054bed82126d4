#include "internal/core/recipe_executor.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "internal/core/persistence.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using longform::core::ExecuteRecipe;
namespace v1 = longform::editor::v1;

bool Near(double a, double b) {
  return std::abs(a - b) < 1e-6;
}

v1::Transcript CatSat() {
  v1::Transcript transcript;
  transcript.set_id("t-1");
  transcript.set_asset_url("s3://media/cat.mp4");
  auto add = [&](const std::string& text, double start, double end) {
    auto* word = transcript.add_words();
    word->set_text(text);
    word->set_start_seconds(start);
    word->set_end_seconds(end);
  };
  add("the", 0.0, 0.3);
  add("cat", 0.3, 0.6);
  add("sat", 0.6, 1.0);
  transcript.set_full_text("the cat sat");
  transcript.set_duration_seconds(1.0);
  return transcript;
}

v1::EditOperation Cut(double start, double end) {
  v1::EditOperation op;
  op.mutable_cut()->mutable_range()->set_start_seconds(start);
  op.mutable_cut()->mutable_range()->set_end_seconds(end);
  return op;
}

v1::EditOperation Reorder(uint32_t from, int32_t to) {
  v1::EditOperation op;
  op.mutable_reorder()->set_from_position(from);
  op.mutable_reorder()->set_to_position(to);
  return op;
}

void ExpectSegment(const v1::EditTimeline& timeline, int index, double start, double end) {
  const auto& segment = timeline.segments(index);
  assert(Near(segment.source_start_seconds(), start));
  assert(Near(segment.source_end_seconds(), end));
  assert(segment.output_order() == static_cast<uint32_t>(index));
}

bool ThrowsExecutionError(const v1::EditRecipe& recipe, const v1::Transcript& transcript) {
  try {
    (void)ExecuteRecipe(recipe, transcript);
  } catch (const longform::util::ExecutionError&) {
    return true;
  }
  return false;
}

void TestCutSplitsTimeline() {
  v1::EditRecipe recipe;
  recipe.set_id("r-1");
  *recipe.add_operations() = Cut(0.3, 0.6);

  auto timeline = ExecuteRecipe(recipe, CatSat());
  assert(timeline.recipe_id() == "r-1");
  assert(timeline.transcript_id() == "t-1");
  assert(timeline.source_asset_url() == "s3://media/cat.mp4");
  assert(timeline.segments_size() == 2);
  ExpectSegment(timeline, 0, 0.0, 0.3);
  ExpectSegment(timeline, 1, 0.6, 1.0);
  assert(!timeline.segments(0).has_transform());
  assert(Near(timeline.output_duration_seconds(), 0.7));
  assert(Near(timeline.source_duration_seconds(), 1.0));
}

void TestEmptyRecipeIsIdentity() {
  auto timeline = ExecuteRecipe(v1::EditRecipe{}, CatSat());
  assert(timeline.segments_size() == 1);
  ExpectSegment(timeline, 0, 0.0, 1.0);
  assert(Near(timeline.output_duration_seconds(), 1.0));
}

void TestExecutionIsDeterministic() {
  v1::EditRecipe recipe;
  *recipe.add_operations() = Cut(0.3, 0.6);
  *recipe.add_operations() = Reorder(1, 0);

  auto first  = ExecuteRecipe(recipe, CatSat());
  auto second = ExecuteRecipe(recipe, CatSat());
  assert(first.SerializeAsString() == second.SerializeAsString());
}

void TestOperationOrderMatters() {
  v1::EditRecipe cut_then_move;
  *cut_then_move.add_operations() = Cut(0.3, 0.6);
  *cut_then_move.add_operations() = Reorder(1, 0);

  auto timeline = ExecuteRecipe(cut_then_move, CatSat());
  assert(timeline.segments_size() == 2);
  ExpectSegment(timeline, 0, 0.6, 1.0);
  ExpectSegment(timeline, 1, 0.0, 0.3);

  // only one segment exists before the cut
  v1::EditRecipe move_then_cut;
  *move_then_cut.add_operations() = Reorder(1, 0);
  *move_then_cut.add_operations() = Cut(0.3, 0.6);
  assert(ThrowsExecutionError(move_then_cut, CatSat()));
}

void TestWordRangeCutAndFillers() {
  v1::EditRecipe recipe;
  v1::EditOperation fillers;
  auto*             range = fillers.mutable_remove_fillers()->add_words();
  range->set_begin(0);
  range->set_end(1);
  *recipe.add_operations() = fillers;

  v1::EditOperation cut;
  auto*             words = cut.mutable_cut()->add_words();
  words->set_begin(2);
  words->set_end(3);
  *recipe.add_operations() = cut;

  auto timeline = ExecuteRecipe(recipe, CatSat());
  assert(timeline.segments_size() == 1);
  ExpectSegment(timeline, 0, 0.3, 0.6);

  // an empty filler list leaves the timeline alone
  v1::EditRecipe none;
  none.add_operations()->mutable_remove_fillers();
  assert(ExecuteRecipe(none, CatSat()).segments_size() == 1);
}

void TestTrimAndPacing() {
  v1::EditRecipe recipe;
  auto*          trim = recipe.add_operations()->mutable_trim();
  trim->set_head_seconds(0.2);
  trim->set_tail_seconds(0.3);

  auto* pacing = recipe.add_operations()->mutable_adjust_pacing();
  pacing->set_speed(2.0);
  pacing->mutable_range()->set_start_seconds(0.4);
  pacing->mutable_range()->set_end_seconds(0.6);

  auto timeline = ExecuteRecipe(recipe, CatSat());
  assert(timeline.segments_size() == 3);
  ExpectSegment(timeline, 0, 0.2, 0.4);
  ExpectSegment(timeline, 1, 0.4, 0.6);
  ExpectSegment(timeline, 2, 0.6, 0.7);
  assert(!timeline.segments(0).has_transform());
  assert(timeline.segments(1).has_transform());
  assert(Near(timeline.segments(1).transform().speed(), 2.0));
  assert(!timeline.segments(2).has_transform());
  // 0.2 at 1x, 0.2 at 2x, 0.1 at 1x
  assert(Near(timeline.output_duration_seconds(), 0.4));
}

void TestOverlayAndSilence() {
  auto transcript = CatSat();
  transcript.set_duration_seconds(3.0);

  v1::EditRecipe recipe;
  auto*          silence = recipe.add_operations()->mutable_remove_silence();
  silence->set_min_gap_seconds(1.0);

  auto* overlay = recipe.add_operations()->mutable_overlay();
  overlay->set_text("Hello");
  overlay->mutable_range()->set_start_seconds(0.5);
  overlay->mutable_range()->set_end_seconds(5.0);

  auto timeline = ExecuteRecipe(recipe, transcript);
  assert(timeline.segments_size() == 1);
  ExpectSegment(timeline, 0, 0.0, 1.0);
  assert(timeline.segments(0).has_transform());
  assert(Near(timeline.segments(0).transform().speed(), 1.0));
  assert(timeline.segments(0).transform().overlays_size() == 1);
  assert(timeline.segments(0).transform().overlays(0).text() == "Hello");
  assert(Near(timeline.segments(0).transform().overlays(0).source_start_seconds(), 0.5));
  assert(Near(timeline.segments(0).transform().overlays(0).source_end_seconds(), 1.0));
}

void TestUnresolvableOperations() {
  {
    v1::EditRecipe recipe;
    *recipe.add_operations() = Cut(5.0, 6.0);
    assert(ThrowsExecutionError(recipe, CatSat()));
  }
  {
    v1::EditRecipe recipe;
    auto*          words = recipe.add_operations()->mutable_cut()->add_words();
    words->set_begin(1);
    words->set_end(9);
    assert(ThrowsExecutionError(recipe, CatSat()));
  }
  {
    v1::EditRecipe recipe;
    recipe.add_operations()->mutable_trim()->set_head_seconds(1.0);
    assert(ThrowsExecutionError(recipe, CatSat()));
  }
  {
    v1::EditRecipe recipe;
    recipe.add_operations()->mutable_adjust_pacing()->set_speed(0.0);
    assert(ThrowsExecutionError(recipe, CatSat()));
  }
  {
    v1::EditRecipe recipe;
    recipe.add_operations();
    assert(ThrowsExecutionError(recipe, CatSat()));
  }
  {
    v1::EditRecipe recipe;
    *recipe.add_operations() = Cut(0.0, 0.3);
    *recipe.add_operations() = Cut(0.0, 0.3);
    try {
      (void)ExecuteRecipe(recipe, CatSat());
      assert(false && "second cut must fail");
    } catch (const longform::util::ExecutionError& e) {
      assert(std::string(e.what()).rfind("operation 1: ", 0) == 0);
    }
  }
}

void TestExecutorLoadsFromRepository() {
  auto repo = std::make_shared<longform::db::memory::MemoryRepository>();
  {
    auto tx         = repo->Begin();
    auto transcript = CatSat();
    assert(repo->InsertTranscript(*tx, longform::core::ToRecord(transcript)));

    v1::EditRecipe recipe;
    recipe.set_id("r-stored");
    recipe.set_transcript_id("t-1");
    *recipe.add_operations() = Cut(0.3, 0.6);
    auto record              = longform::core::ToRecord(recipe);
    assert(repo->InsertRecipeWithNextVersion(*tx, record));
    tx->Commit();
  }

  longform::core::RecipeExecutor executor(repo);
  auto                           timeline = executor.Execute("r-stored", "t-1");
  assert(timeline.segments_size() == 2);

  bool recipe_missing = false;
  try {
    (void)executor.Execute("r-missing", "t-1");
  } catch (const longform::util::RecipeNotFound&) {
    recipe_missing = true;
  }
  assert(recipe_missing);

  bool transcript_missing = false;
  try {
    (void)executor.Execute("r-stored", "t-missing");
  } catch (const longform::util::TranscriptNotFound&) {
    transcript_missing = true;
  }
  assert(transcript_missing);
}

// ------------------------------------------------------------------
// Randomized recipes
// ------------------------------------------------------------------

v1::Transcript RandomTranscript(std::mt19937& rng) {
  std::uniform_int_distribution<int> word_count(1, 12);
  std::uniform_int_distribution<int> gap_tenths(0, 15);
  std::uniform_int_distribution<int> length_tenths(1, 8);

  v1::Transcript transcript;
  transcript.set_id("t-random");
  transcript.set_asset_url("s3://media/random.mp4");

  double      cursor = gap_tenths(rng) * 0.1;
  std::string text;
  const int   count = word_count(rng);
  for (int i = 0; i < count; ++i) {
    auto* word = transcript.add_words();
    word->set_text("w" + std::to_string(i));
    word->set_start_seconds(cursor);
    word->set_end_seconds(cursor + length_tenths(rng) * 0.1);
    cursor = word->end_seconds() + gap_tenths(rng) * 0.1;
    text += (i == 0 ? "" : " ") + word->text();
  }
  transcript.set_full_text(text);
  transcript.set_duration_seconds(cursor + gap_tenths(rng) * 0.1);
  return transcript;
}

v1::EditOperation RandomOperation(std::mt19937& rng, const v1::Transcript& transcript) {
  const double                           duration = transcript.duration_seconds();
  const auto                             words    = static_cast<uint32_t>(transcript.words_size());
  std::uniform_real_distribution<double> point(0.0, duration);
  std::uniform_int_distribution<int>     kind(0, 7);

  auto ordered = [&]() {
    double a = point(rng);
    double b = point(rng);
    return std::make_pair(std::min(a, b), std::max(a, b));
  };

  v1::EditOperation op;
  switch (kind(rng)) {
    case 0: {
      auto [start, end] = ordered();
      op.mutable_cut()->mutable_range()->set_start_seconds(start);
      op.mutable_cut()->mutable_range()->set_end_seconds(end);
      break;
    }
    case 1: {
      const auto begin = std::uniform_int_distribution<uint32_t>(0, words - 1)(rng);
      const auto end   = std::uniform_int_distribution<uint32_t>(begin + 1, words)(rng);
      auto*      range = op.mutable_cut()->add_words();
      range->set_begin(begin);
      range->set_end(end);
      break;
    }
    case 2: {
      std::uniform_real_distribution<double> third(0.0, duration / 3);
      op.mutable_trim()->set_head_seconds(third(rng));
      op.mutable_trim()->set_tail_seconds(third(rng));
      break;
    }
    case 3:
      op.mutable_reorder()->set_from_position(std::uniform_int_distribution<uint32_t>(0, 4)(rng));
      op.mutable_reorder()->set_to_position(std::uniform_int_distribution<int32_t>(-1, 4)(rng));
      break;
    case 4: {
      auto [start, end] = ordered();
      op.mutable_overlay()->mutable_range()->set_start_seconds(start);
      op.mutable_overlay()->mutable_range()->set_end_seconds(end);
      op.mutable_overlay()->set_text("title");
      break;
    }
    case 5:
      op.mutable_remove_silence()->set_min_gap_seconds(std::uniform_real_distribution<double>(0.2, 1.5)(rng));
      break;
    case 6: {
      const int fillers = std::uniform_int_distribution<int>(0, 2)(rng);
      auto*     remove  = op.mutable_remove_fillers();
      for (int i = 0; i < fillers; ++i) {
        const auto begin = std::uniform_int_distribution<uint32_t>(0, words - 1)(rng);
        auto*      range = remove->add_words();
        range->set_begin(begin);
        range->set_end(begin + 1);
      }
      break;
    }
    default: {
      auto* pacing = op.mutable_adjust_pacing();
      pacing->set_speed(std::uniform_real_distribution<double>(0.5, 2.0)(rng));
      if (std::bernoulli_distribution(0.5)(rng)) {
        auto [start, end] = ordered();
        pacing->mutable_range()->set_start_seconds(start);
        pacing->mutable_range()->set_end_seconds(end);
      }
      break;
    }
  }
  return op;
}

void ExpectWellFormed(const v1::EditTimeline& timeline) {
  std::vector<std::pair<double, double>> spans;
  double                                 output = 0.0;
  for (int i = 0; i < timeline.segments_size(); ++i) {
    const auto& segment = timeline.segments(i);
    assert(segment.output_order() == static_cast<uint32_t>(i));
    assert(segment.source_end_seconds() > segment.source_start_seconds());
    assert(segment.source_start_seconds() >= -1e-9);
    assert(segment.source_end_seconds() <= timeline.source_duration_seconds() + 1e-9);

    double speed = 1.0;
    if (segment.has_transform()) {
      speed = segment.transform().speed();
      assert(speed > 0);
      for (const auto& overlay : segment.transform().overlays()) {
        assert(overlay.source_start_seconds() >= segment.source_start_seconds() - 1e-9);
        assert(overlay.source_end_seconds() <= segment.source_end_seconds() + 1e-9);
      }
    }
    output += (segment.source_end_seconds() - segment.source_start_seconds()) / speed;
    spans.emplace_back(segment.source_start_seconds(), segment.source_end_seconds());
  }
  assert(Near(output, timeline.output_duration_seconds()));

  // each source instant is used at most once
  std::sort(spans.begin(), spans.end());
  for (std::size_t i = 1; i < spans.size(); ++i) {
    assert(spans[i - 1].second <= spans[i].first + 1e-9);
  }
}

void TestRandomRecipesKeepTimelineInvariants() {
  std::mt19937 rng(20240611);
  int          executed = 0;
  int          rejected = 0;

  for (int round = 0; round < 500; ++round) {
    const auto transcript = RandomTranscript(rng);

    auto identity = ExecuteRecipe(v1::EditRecipe{}, transcript);
    assert(identity.segments_size() == 1);
    ExpectSegment(identity, 0, 0.0, transcript.duration_seconds());
    assert(!identity.segments(0).has_transform());
    assert(Near(identity.output_duration_seconds(), transcript.duration_seconds()));

    v1::EditRecipe recipe;
    recipe.set_id("r-random");
    const int ops = std::uniform_int_distribution<int>(1, 6)(rng);
    for (int i = 0; i < ops; ++i) {
      *recipe.add_operations() = RandomOperation(rng, transcript);
    }

    v1::EditTimeline first;
    try {
      first = ExecuteRecipe(recipe, transcript);
    } catch (const longform::util::ExecutionError&) {
      ++rejected;
      // rejection is deterministic too
      assert(ThrowsExecutionError(recipe, transcript));
      continue;
    }
    ++executed;
    ExpectWellFormed(first);

    auto second = ExecuteRecipe(recipe, transcript);
    assert(first.SerializeAsString() == second.SerializeAsString());
  }

  // the generator exercises both outcomes
  assert(executed > 50);
  assert(rejected > 0);
}

void TestRandomCutReorderPairsAreOrderSensitive() {
  std::mt19937 rng(7);

  for (int round = 0; round < 200; ++round) {
    auto transcript = RandomTranscript(rng);
    transcript.set_duration_seconds(std::max(transcript.duration_seconds(), 3.0));

    // disjoint interior cuts on a 0.1s grid leave cuts + 1 segments
    const int        cuts  = std::uniform_int_distribution<int>(1, 3)(rng);
    const int        slots = static_cast<int>(std::floor(transcript.duration_seconds() * 10)) - 2;
    std::vector<int> grid(static_cast<std::size_t>(slots));
    for (int i = 0; i < slots; ++i) {
      grid[static_cast<std::size_t>(i)] = i + 1;
    }
    std::shuffle(grid.begin(), grid.end(), rng);
    grid.resize(static_cast<std::size_t>(cuts * 2));
    std::sort(grid.begin(), grid.end());

    v1::EditRecipe forward;
    for (int i = 0; i < cuts; ++i) {
      *forward.add_operations() = Cut(grid[static_cast<std::size_t>(2 * i)] * 0.1, grid[static_cast<std::size_t>(2 * i + 1)] * 0.1);
    }

    const auto from = std::uniform_int_distribution<uint32_t>(0, static_cast<uint32_t>(cuts))(rng);
    int32_t    to   = std::uniform_int_distribution<int32_t>(-1, cuts)(rng);
    if (to == static_cast<int32_t>(from) || (to == -1 && from == static_cast<uint32_t>(cuts))) {
      to = from == 0 ? 1 : 0;
    }
    *forward.add_operations() = Reorder(from, to);

    v1::EditRecipe reversed;
    *reversed.add_operations() = Reorder(from, to);
    for (int i = 0; i < cuts; ++i) {
      *reversed.add_operations() = forward.operations(i);
    }

    auto timeline = ExecuteRecipe(forward, transcript);
    assert(timeline.segments_size() == cuts + 1);
    ExpectWellFormed(timeline);

    bool changed = false;
    try {
      changed = ExecuteRecipe(reversed, transcript).SerializeAsString() != timeline.SerializeAsString();
    } catch (const longform::util::ExecutionError&) {
      changed = true;
    }
    assert(changed);
  }
}

} // namespace

int main() {
  TestCutSplitsTimeline();
  TestEmptyRecipeIsIdentity();
  TestExecutionIsDeterministic();
  TestOperationOrderMatters();
  TestWordRangeCutAndFillers();
  TestTrimAndPacing();
  TestOverlayAndSilence();
  TestUnresolvableOperations();
  TestExecutorLoadsFromRepository();
  TestRandomRecipesKeepTimelineInvariants();
  TestRandomCutReorderPairsAreOrderSensitive();

  std::cout << "longform_editor_unit_recipe_executor: pass\n";
  return 0;
}
