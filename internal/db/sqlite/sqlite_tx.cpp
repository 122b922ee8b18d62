#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace localdeck::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    LOCALDECK_LOG_WARN("sqlite rollback failed", {localdeck::observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace localdeck::db::sqlite
