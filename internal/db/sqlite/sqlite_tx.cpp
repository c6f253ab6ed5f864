#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace goalgraph::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& ex) {
    GOALGRAPH_LOG_ERROR("SQLite rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", ex.what())});
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

} // namespace goalgraph::db::sqlite
