#include "pg_schema.hpp"

namespace longform::db::postgres {

void BootstrapSchema(const std::shared_ptr<PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS transcripts (id TEXT PRIMARY KEY, deliverable_id TEXT, asset_url TEXT NOT NULL, words_json JSONB NOT NULL, full_text TEXT NOT NULL, duration_seconds DOUBLE PRECISION NOT NULL, meta_json JSONB, created_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS edit_recipes (id TEXT PRIMARY KEY, deliverable_id TEXT, transcript_id TEXT, instructions TEXT NOT NULL, operations_json JSONB NOT NULL, version INTEGER NOT NULL, compiler_revision TEXT NOT NULL, created_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE UNIQUE INDEX IF NOT EXISTS edit_recipes_deliverable_version ON edit_recipes(deliverable_id, version) WHERE deliverable_id IS NOT NULL;");
  tx.exec("CREATE TABLE IF NOT EXISTS renders (id TEXT PRIMARY KEY, seq BIGSERIAL, deliverable_id TEXT, recipe_id TEXT, kind SMALLINT NOT NULL, status SMALLINT NOT NULL, task_id TEXT NOT NULL, aspect_ratio TEXT NOT NULL, provider_job_id TEXT, asset_id TEXT, metrics_json JSONB, row_version BIGINT NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL, completed_at_ms BIGINT);");
  tx.exec("CREATE INDEX IF NOT EXISTS renders_deliverable_created ON renders(deliverable_id, created_at_ms DESC);");
  tx.exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());");
  tx.exec("INSERT INTO schema_migrations(version) VALUES(1) ON CONFLICT DO NOTHING;");
  tx.commit();
}

} // namespace longform::db::postgres
