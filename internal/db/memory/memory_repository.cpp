#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace longform::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertTranscript(Transaction& t, const model::TranscriptRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.transcripts.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "transcript exists: " + r.id);
  s.transcripts[r.id] = r;
  return Result::Ok();
}

std::optional<model::TranscriptRecord> MemoryRepository::GetTranscript(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.transcripts.find(id);
  if (it == s.transcripts.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertRecipeWithNextVersion(Transaction& t, model::RecipeRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.recipes.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "recipe exists: " + r.id);

  uint32_t next = 1;
  if (!r.deliverable_id.empty()) {
    for (const auto& [_, existing] : s.recipes) {
      if (existing.deliverable_id == r.deliverable_id) {
        next = std::max(next, existing.version + 1);
      }
    }
  }

  r.version       = next;
  s.recipes[r.id] = r;
  return Result::Ok();
}

std::optional<model::RecipeRecord> MemoryRepository::GetRecipe(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.recipes.find(id);
  if (it == s.recipes.end()) return std::nullopt;
  return it->second;
}

std::vector<model::RecipeRecord> MemoryRepository::ListRecipes(Transaction& t, const std::string& deliverable_id) {
  const auto&                      s = TX(t).View();
  std::vector<model::RecipeRecord> out;
  for (const auto& [_, r] : s.recipes) {
    if (r.deliverable_id == deliverable_id) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.version != b.version) return a.version > b.version;
    return a.created_at_ms > b.created_at_ms;
  });
  return out;
}

Result MemoryRepository::InsertRender(Transaction& t, const model::RenderRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.renders.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "render exists: " + r.id);
  s.renders[r.id] = r;
  s.render_order.push_back(r.id);
  return Result::Ok();
}

std::optional<model::RenderRecord> MemoryRepository::GetRender(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.renders.find(id);
  if (it == s.renders.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateRender(Transaction& t, const model::RenderRecord& r, uint64_t expected_row_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.renders.find(r.id);
  if (it == s.renders.end()) return Result::Err(ErrorCode::NotFound, "render not found: " + r.id);
  if (it->second.row_version != expected_row_version) {
    return Result::Err(ErrorCode::Conflict, "render modified concurrently: " + r.id);
  }

  it->second             = r;
  it->second.row_version = expected_row_version + 1;
  return Result::Ok();
}

std::vector<model::RenderRecord> MemoryRepository::ListRenders(Transaction& t, const model::RenderFilter& filter) {
  const auto&                      s = TX(t).View();
  std::vector<model::RenderRecord> out;

  // newest insertion first; stable sort keeps that order within equal timestamps
  for (auto it = s.render_order.rbegin(); it != s.render_order.rend(); ++it) {
    const auto& r = s.renders.at(*it);
    if (filter.deliverable_id && r.deliverable_id != *filter.deliverable_id) continue;
    if (filter.kind && r.kind != *filter.kind) continue;
    out.push_back(r);
  }

  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at_ms > b.created_at_ms; });
  if (out.size() > filter.limit) out.resize(filter.limit);
  return out;
}

} // namespace longform::db::memory
