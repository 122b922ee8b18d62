#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace localdeck::db::sqlite {

// Brings the database up to the newest schema inside one transaction.
// Returns the number of migrations applied.
int ApplySchema(const std::shared_ptr<SqliteDB>& db);

} // namespace localdeck::db::sqlite
