#pragma once

#include <string>
#include <vector>

namespace localdeck::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and reports the highest version
  already recorded in tracks_schema_migrations.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  virtual int AppliedVersion() = 0;

  virtual void RecordVersion(int version) = 0;
};

struct Migration {
  int                      version = 0;
  std::vector<std::string> statements;
};

// Ordered by version.
const std::vector<Migration>& SchemaMigrations();

/*
  Applies every migration newer than AppliedVersion(), in order.
  Returns the number applied.
*/
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

} // namespace localdeck::db::sql
