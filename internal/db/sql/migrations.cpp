#include "migrations.hpp"

#include "sql_queries.hpp"

namespace localdeck::db::sql {

const std::vector<Migration>& SchemaMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1, {CREATE_TRACKS, CREATE_TRACKS_CONTENT_INDEX}},
  };
  return kMigrations;
}

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  executor.ExecuteSQL(CREATE_SCHEMA_MIGRATIONS);

  const int applied_version = executor.AppliedVersion();
  int       applied         = 0;
  for (const auto& migration : ordered) {
    if (migration.version <= applied_version) {
      continue;
    }
    for (const auto& statement : migration.statements) {
      executor.ExecuteSQL(statement);
    }
    executor.RecordVersion(migration.version);
    ++applied;
  }
  return applied;
}

} // namespace localdeck::db::sql
