#pragma once

#include <memory>

namespace longform::core {
class TranscriptStore;
class RecipeCompiler;
class RecipeExecutor;
class RenderOrchestrator;
class VoiceCommandBridge;
} // namespace longform::core
namespace longform::providers {
class TranscriptionProvider;
class RenderProvider;
} // namespace longform::providers
namespace longform::db {
class Repository;
}

namespace longform::service {

/*
  Dependency container shared by the service layer.
*/
struct ServiceContext {
  std::shared_ptr<longform::db::Repository> repository;

  std::shared_ptr<longform::core::TranscriptStore>    transcripts;
  std::shared_ptr<longform::core::RecipeCompiler>     compiler;
  std::shared_ptr<longform::core::RecipeExecutor>     executor;
  std::shared_ptr<longform::core::RenderOrchestrator> renders;
  std::shared_ptr<longform::core::VoiceCommandBridge> voice;

  // used for health reporting only
  std::shared_ptr<longform::providers::TranscriptionProvider> transcription_provider;
  std::shared_ptr<longform::providers::RenderProvider>        render_provider;
};

} // namespace longform::service
