#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace longform::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS transcripts (id TEXT PRIMARY KEY, deliverable_id TEXT, asset_url TEXT NOT NULL, words_json TEXT NOT NULL, full_text TEXT NOT NULL, duration_seconds REAL NOT NULL, meta_json TEXT, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS edit_recipes (id TEXT PRIMARY KEY, deliverable_id TEXT, transcript_id TEXT, instructions TEXT NOT NULL, operations_json TEXT NOT NULL, version INTEGER NOT NULL, compiler_revision TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS edit_recipes_deliverable_version ON edit_recipes(deliverable_id, version) WHERE deliverable_id IS NOT NULL;",
      "CREATE TABLE IF NOT EXISTS renders (id TEXT PRIMARY KEY, deliverable_id TEXT, recipe_id TEXT, kind INTEGER NOT NULL, status INTEGER NOT NULL, task_id TEXT NOT NULL, aspect_ratio TEXT NOT NULL, provider_job_id TEXT, asset_id TEXT, metrics_json TEXT, row_version INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, completed_at_ms INTEGER);",
      "CREATE INDEX IF NOT EXISTS renders_deliverable_created ON renders(deliverable_id, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO schema_migrations(version, applied_at_ms) VALUES(1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace longform::db::sqlite
