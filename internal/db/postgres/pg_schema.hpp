#pragma once

#include <memory>

#include "pg_pool.hpp"

namespace longform::db::postgres {

// Creates tables and indexes if missing. Idempotent.
void BootstrapSchema(const std::shared_ptr<PgPool>& pool);

} // namespace longform::db::postgres
