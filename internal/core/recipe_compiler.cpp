#include "internal/core/recipe_compiler.hpp"

#include <stdexcept>

#include "internal/core/persistence.hpp"
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

constexpr int kMaxVersionAttempts = 8;

bool Blank(const std::string& s) {
  return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

void CheckInstructions(const std::string& instructions, const ParserOptions& options) {
  if (Blank(instructions)) {
    throw util::InvalidInput("instructions are required");
  }
  if (instructions.size() > options.max_instruction_bytes) {
    throw util::InvalidInput("instructions exceed " + std::to_string(options.max_instruction_bytes) + " bytes");
  }
}

} // namespace

RecipeCompiler::RecipeCompiler(std::shared_ptr<db::Repository> repository, ParserOptions options, std::string revision)
    : repository_(std::move(repository)), parser_(std::move(options)), revision_(revision.empty() ? kDefaultRevision : std::move(revision)) {
}

std::optional<double> RecipeCompiler::TranscriptDuration(const std::string& transcript_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetTranscript(*tx, transcript_id);
  tx->Commit();

  if (!record) {
    throw util::TranscriptNotFound("transcript not found: " + transcript_id);
  }
  if (record->duration_seconds <= 0) {
    return std::nullopt;
  }
  return record->duration_seconds;
}

v1::EditRecipe RecipeCompiler::Persist(v1::EditRecipe recipe) {
  for (int attempt = 1;; ++attempt) {
    recipe.set_id(util::NewId());
    *recipe.mutable_created_at() = util::ToProto(util::Now());

    auto record = ToRecord(recipe);
    try {
      auto tx = repository_->Begin();
      ThrowIfDbError(repository_->InsertRecipeWithNextVersion(*tx, record), "insert recipe");
      tx->Commit();
    } catch (const util::Conflict& e) {
      if (attempt >= kMaxVersionAttempts) {
        // storage conflicts stay internal; callers see a plain failure
        LONGFORM_LOG_ERROR("recipe version allocation exhausted",
                           {StringField("deliverable_id", recipe.deliverable_id()), IntField("attempts", attempt), StringField("error", e.what())});
        throw std::runtime_error("recipe version allocation failed after " + std::to_string(attempt) + " attempts");
      }
      LONGFORM_LOG_DEBUG("recipe version conflict, retrying",
                         {StringField("deliverable_id", recipe.deliverable_id()), IntField("attempt", attempt)});
      continue;
    }

    recipe.set_version(record.version);
    return recipe;
  }
}

CompileResult RecipeCompiler::Compile(const CompileRequest& request) {
  CheckInstructions(request.instructions, parser_.Options());
  if (Blank(request.transcript_text)) {
    throw util::InvalidInput("transcriptText is required");
  }

  ParseContext context;
  context.transcript_text = request.transcript_text;
  if (request.transcript_id && !request.transcript_id->empty()) {
    context.duration_seconds = TranscriptDuration(*request.transcript_id);
  }

  auto parsed = parser_.Parse(request.instructions, context);

  v1::EditRecipe recipe;
  if (request.deliverable_id) {
    recipe.set_deliverable_id(*request.deliverable_id);
  }
  if (request.transcript_id) {
    recipe.set_transcript_id(*request.transcript_id);
  }
  recipe.set_instructions(request.instructions);
  recipe.set_compiler_revision(revision_);
  for (auto& op : parsed.operations) {
    *recipe.add_operations() = std::move(op);
  }

  CompileResult result;
  result.recipe            = Persist(std::move(recipe));
  result.dropped_fragments = std::move(parsed.dropped_fragments);

  observability::Metrics::Instance().RecordDroppedFragments(result.dropped_fragments.size());
  LONGFORM_LOG_INFO("recipe compiled", {StringField("recipe_id", result.recipe.id()), StringField("deliverable_id", result.recipe.deliverable_id()),
                                        IntField("version", result.recipe.version()), IntField("operations", result.recipe.operations_size()),
                                        IntField("dropped", static_cast<std::int64_t>(result.dropped_fragments.size()))});
  return result;
}

CompileResult RecipeCompiler::Extend(const std::string& base_recipe_id, const std::string& instructions, const std::string& transcript_text) {
  CheckInstructions(instructions, parser_.Options());
  if (Blank(transcript_text)) {
    throw util::InvalidInput("transcriptText is required");
  }

  auto base = Get(base_recipe_id);

  ParseContext context;
  context.transcript_text = transcript_text;
  if (!base.transcript_id().empty()) {
    context.duration_seconds = TranscriptDuration(base.transcript_id());
  }

  auto parsed = parser_.Parse(instructions, context);

  v1::EditRecipe recipe;
  recipe.set_deliverable_id(base.deliverable_id());
  recipe.set_transcript_id(base.transcript_id());
  recipe.set_instructions(base.instructions().empty() ? instructions : base.instructions() + "\n" + instructions);
  recipe.set_compiler_revision(revision_);
  *recipe.mutable_operations() = base.operations();
  for (auto& op : parsed.operations) {
    *recipe.add_operations() = std::move(op);
  }

  CompileResult result;
  result.recipe            = Persist(std::move(recipe));
  result.dropped_fragments = std::move(parsed.dropped_fragments);

  observability::Metrics::Instance().RecordDroppedFragments(result.dropped_fragments.size());
  LONGFORM_LOG_INFO("recipe extended", {StringField("recipe_id", result.recipe.id()), StringField("base_recipe_id", base_recipe_id),
                                        IntField("version", result.recipe.version()), IntField("operations", result.recipe.operations_size())});
  return result;
}

v1::EditRecipe RecipeCompiler::Get(const std::string& id) {
  if (id.empty()) {
    throw util::InvalidInput("recipe id is required");
  }

  auto tx     = repository_->Begin();
  auto record = repository_->GetRecipe(*tx, id);
  tx->Commit();

  if (!record) {
    throw util::RecipeNotFound("recipe not found: " + id);
  }
  return FromRecord(*record);
}

std::vector<v1::EditRecipe> RecipeCompiler::List(const std::string& deliverable_id) {
  if (deliverable_id.empty()) {
    throw util::InvalidInput("deliverableId is required");
  }

  auto tx      = repository_->Begin();
  auto records = repository_->ListRecipes(*tx, deliverable_id);
  tx->Commit();

  std::vector<v1::EditRecipe> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(FromRecord(record));
  }
  return out;
}

std::optional<v1::EditRecipe> RecipeCompiler::Latest(const std::string& deliverable_id) {
  auto recipes = List(deliverable_id);
  if (recipes.empty()) {
    return std::nullopt;
  }
  return recipes.front();
}

} // namespace longform::core
