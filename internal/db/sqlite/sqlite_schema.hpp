#pragma once

#include "sqlite_db.hpp"

namespace longform::db::sqlite {

// Creates tables and indexes if missing. Idempotent.
void BootstrapSchema(SqliteDB& db);

} // namespace longform::db::sqlite
