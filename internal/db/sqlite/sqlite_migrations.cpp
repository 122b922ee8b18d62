#include "sqlite_migrations.hpp"

#include <stdexcept>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/time.hpp"
#include "sqlite_tx.hpp"

namespace localdeck::db::sqlite {

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& statement) override {
    db_.Exec(statement);
  }

  int AppliedVersion() override {
    sqlite3_stmt* st = db_.Prepare(sql::SELECT_SCHEMA_VERSION);
    int           rc = sqlite3_step(st);
    int version      = rc == SQLITE_ROW ? sqlite3_column_int(st, 0) : 0;
    sqlite3_finalize(st);
    if (rc != SQLITE_ROW) {
      throw std::runtime_error(std::string("read schema version: ") + sqlite3_errmsg(db_.Handle()));
    }
    return version;
  }

  void RecordVersion(int version) override {
    sqlite3_stmt* st = db_.Prepare(sql::INSERT_SCHEMA_VERSION);
    sqlite3_bind_int(st, 1, version);
    sqlite3_bind_int64(st, 2, static_cast<sqlite3_int64>(localdeck::util::NowMillis()));
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
      throw std::runtime_error(std::string("record schema version: ") + sqlite3_errmsg(db_.Handle()));
    }
  }

 private:
  SqliteDB& db_;
};

} // namespace

int ApplySchema(const std::shared_ptr<SqliteDB>& db) {
  SqliteTransaction       tx(db);
  SqliteMigrationExecutor executor(*db);
  const int               applied = sql::RunMigrations(executor, sql::SchemaMigrations());
  tx.Commit();
  return applied;
}

} // namespace localdeck::db::sqlite
