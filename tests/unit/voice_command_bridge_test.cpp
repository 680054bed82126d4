#include "internal/core/voice_command_bridge.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fake_providers.hpp"

namespace {

using longform::core::VoiceCommandBridge;
using longform::core::VoiceCommandRequest;
namespace v1 = longform::editor::v1;

struct Fixture {
  Fixture() {
    auto executor = std::make_shared<longform::core::RecipeExecutor>(repo);
    transcripts   = std::make_shared<longform::core::TranscriptStore>(repo, transcription);
    compiler      = std::make_shared<longform::core::RecipeCompiler>(repo, longform::core::ParserOptions{});
    renders       = std::make_shared<longform::core::RenderOrchestrator>(repo, render, executor, longform::core::RenderSettings{});
    bridge        = std::make_shared<VoiceCommandBridge>(transcripts, compiler, renders, v1::RENDER_QUALITY_PREVIEW);
    transcript    = transcripts->Transcribe("s3://media/cat.mp4", std::string("d-1"));
  }

  VoiceCommandRequest Command(const std::string& command, bool auto_render) const {
    VoiceCommandRequest request;
    request.command       = command;
    request.transcript_id = transcript.id();
    request.auto_render   = auto_render;
    if (auto_render) {
      request.task_id = "task-1";
    }
    return request;
  }

  std::shared_ptr<longform::db::memory::MemoryRepository>        repo          = std::make_shared<longform::db::memory::MemoryRepository>();
  std::shared_ptr<longform::testing::FakeTranscriptionProvider> transcription = std::make_shared<longform::testing::FakeTranscriptionProvider>();
  std::shared_ptr<longform::testing::FakeRenderProvider>        render        = std::make_shared<longform::testing::FakeRenderProvider>();
  std::shared_ptr<longform::core::TranscriptStore>               transcripts;
  std::shared_ptr<longform::core::RecipeCompiler>                compiler;
  std::shared_ptr<longform::core::RenderOrchestrator>            renders;
  std::shared_ptr<VoiceCommandBridge>                            bridge;
  v1::Transcript                                                 transcript;
};

void TestCommandWithoutRender() {
  Fixture f;
  auto    result = f.bridge->ProcessCommand(f.Command("remove filler words", false));

  assert(!result.recipe.id().empty());
  assert(result.recipe.operations_size() == 1);
  assert(result.recipe.operations(0).has_remove_fillers());
  assert(result.recipe.deliverable_id() == "d-1");
  assert(result.recipe.transcript_id() == f.transcript.id());
  assert(result.recipe.version() == 1);
  assert(!result.render.has_value());
  assert(!result.render_error.has_value());
  assert(result.message == VoiceCommandBridge::kMessageCreated);
  assert(f.render->submit_calls == 0);

  // auto render without a task id does not render
  auto no_task    = f.Command("tighten the pacing", true);
  no_task.task_id = std::nullopt;
  auto unrendered = f.bridge->ProcessCommand(no_task);
  assert(!unrendered.render.has_value());
  assert(f.render->submit_calls == 0);
}

void TestCommandWithRender() {
  Fixture f;
  auto    result = f.bridge->ProcessCommand(f.Command("remove filler words", true));

  assert(result.recipe.operations_size() == 1);
  assert(result.render.has_value());
  assert(result.render->status() == v1::RENDER_STATUS_QUEUED);
  assert(result.render->recipe_id() == result.recipe.id());
  assert(result.render->kind() == v1::RENDER_QUALITY_PREVIEW);
  assert(result.render->deliverable_id() == "d-1");
  assert(result.message == VoiceCommandBridge::kMessageRenderStarted);
  assert(f.render->submitted.size() == 1);
  assert(f.render->submitted[0].timeline().segments_size() == 1);
}

void TestFollowUpCommandsExtendLatestRecipe() {
  Fixture f;
  auto    first  = f.bridge->ProcessCommand(f.Command("remove filler words", false));
  auto    second = f.bridge->ProcessCommand(f.Command("speed up by 10%", false));

  assert(second.recipe.version() == 2);
  assert(second.recipe.operations_size() == 2);
  assert(second.recipe.operations(0).has_remove_fillers());
  assert(second.recipe.operations(1).has_adjust_pacing());
  assert(second.recipe.id() != first.recipe.id());

  // a different transcript starts over from its own operations
  auto other = f.transcripts->Transcribe("s3://media/cat-take2.mp4", std::string("d-1"));
  auto cmd   = f.Command("speed up by 10%", false);
  cmd.transcript_id = other.id();
  auto fresh        = f.bridge->ProcessCommand(cmd);
  assert(fresh.recipe.version() == 3);
  assert(fresh.recipe.operations_size() == 1);
  assert(fresh.recipe.transcript_id() == other.id());
}

void TestRenderFailureKeepsRecipe() {
  Fixture f;
  f.render->reject = true;

  auto result = f.bridge->ProcessCommand(f.Command("remove filler words", true));
  assert(!result.recipe.id().empty());
  assert(!result.render.has_value());
  assert(result.render_error.has_value());
  assert(result.render_error->kind() == "RenderSubmissionFailed");
  assert(result.message == VoiceCommandBridge::kMessageRenderFailed);

  // the recipe is stored even though the render failed
  assert(f.compiler->Get(result.recipe.id()).version() == 1);
}

void TestExecutionFailureIsReported() {
  Fixture f;
  auto    result = f.bridge->ProcessCommand(f.Command("move segment 3 to the start", true));
  assert(result.recipe.operations_size() == 1);
  assert(result.render_error.has_value());
  assert(result.render_error->kind() == "ExecutionError");
  assert(f.render->submit_calls == 0);
}

void TestInvalidRequests() {
  Fixture f;

  bool blank = false;
  try {
    (void)f.bridge->ProcessCommand(f.Command("   ", false));
  } catch (const longform::util::InvalidInput&) {
    blank = true;
  }
  assert(blank);

  // a runaway dictation is rejected before anything is parsed or stored
  bool oversize = false;
  try {
    (void)f.bridge->ProcessCommand(f.Command("cut" + std::string(100000, ' ') + "\"cat\"", true));
  } catch (const longform::util::InvalidInput&) {
    oversize = true;
  }
  assert(oversize);
  assert(f.compiler->List("d-1").empty());
  assert(f.render->submit_calls == 0);

  auto unknown          = f.Command("remove filler words", false);
  unknown.transcript_id = "missing";
  bool missing          = false;
  try {
    (void)f.bridge->ProcessCommand(unknown);
  } catch (const longform::util::TranscriptNotFound&) {
    missing = true;
  }
  assert(missing);
}

} // namespace

int main() {
  TestCommandWithoutRender();
  TestCommandWithRender();
  TestFollowUpCommandsExtendLatestRecipe();
  TestRenderFailureKeepsRecipe();
  TestExecutionFailureIsReported();
  TestInvalidRequests();

  std::cout << "longform_editor_unit_voice_command_bridge: pass\n";
  return 0;
}
