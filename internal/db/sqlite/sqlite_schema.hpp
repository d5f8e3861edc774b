#pragma once

#include "sqlite_db.hpp"

namespace cms::db::sqlite {

// Creates the admin tables if missing. Idempotent.
void BootstrapSchema(SqliteDB& db);

} // namespace cms::db::sqlite
