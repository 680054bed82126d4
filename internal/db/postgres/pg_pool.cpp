#include "pg_pool.hpp"

namespace longform::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_transcript",
               "SELECT id, deliverable_id, asset_url, words_json::text, full_text, duration_seconds, meta_json::text, created_at_ms "
               "FROM transcripts WHERE id=$1");

  conn.prepare("insert_transcript",
               "INSERT INTO transcripts(id,deliverable_id,asset_url,words_json,full_text,duration_seconds,meta_json,created_at_ms) "
               "VALUES($1,$2,$3,$4::jsonb,$5,$6,$7::jsonb,$8)");

  conn.prepare("insert_recipe_next_version",
               "INSERT INTO edit_recipes(id,deliverable_id,transcript_id,instructions,operations_json,version,compiler_revision,created_at_ms) "
               "SELECT $1,$2::text,$3,$4,$5::jsonb,"
               "CASE WHEN $2::text IS NULL THEN 1 ELSE COALESCE(MAX(version),0)+1 END,"
               "$6,$7 FROM edit_recipes WHERE deliverable_id=$2::text "
               "RETURNING version");

  conn.prepare("get_recipe",
               "SELECT id, deliverable_id, transcript_id, instructions, operations_json::text, version, compiler_revision, created_at_ms "
               "FROM edit_recipes WHERE id=$1");

  conn.prepare("list_recipes",
               "SELECT id, deliverable_id, transcript_id, instructions, operations_json::text, version, compiler_revision, created_at_ms "
               "FROM edit_recipes WHERE deliverable_id=$1 ORDER BY version DESC");

  conn.prepare("insert_render",
               "INSERT INTO renders(id,deliverable_id,recipe_id,kind,status,task_id,aspect_ratio,provider_job_id,asset_id,metrics_json,row_version,created_at_ms,completed_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10::jsonb,$11,$12,$13)");

  conn.prepare("get_render",
               "SELECT id, deliverable_id, recipe_id, kind, status, task_id, aspect_ratio, provider_job_id, asset_id, metrics_json::text, row_version, created_at_ms, completed_at_ms "
               "FROM renders WHERE id=$1");

  conn.prepare("update_render",
               "UPDATE renders SET status=$2,provider_job_id=$3,asset_id=$4,metrics_json=$5::jsonb,completed_at_ms=$6,row_version=row_version+1 "
               "WHERE id=$1 AND row_version=$7");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace longform::db::postgres
