#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>
#include <vector>

namespace goalgraph::db::sqlite {

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Ok() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }
  sqlite3_stmt* get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// Empty strings are stored as NULL.
void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, std::uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

std::uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<std::uint64_t>(sqlite3_column_int64(st, col));
}

model::GoalRecord ReadGoal(sqlite3_stmt* st) {
  model::GoalRecord r;
  r.id            = ColText(st, 0);
  r.parent_id     = ColText(st, 1);
  r.owner_id      = ColText(st, 2);
  r.sort_index    = ColI64(st, 3);
  r.document      = ColText(st, 4);
  r.updated_at_ms = ColU64(st, 5);
  return r;
}

constexpr const char* kGoalColumns = "id,parent_id,owner_id,sort_index,document,updated_at_ms";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (sqlite3_extended_errcode(db)) {
    case SQLITE_CONSTRAINT_PRIMARYKEY:
    case SQLITE_CONSTRAINT_UNIQUE:
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    default:
      break;
  }

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS goal (id TEXT PRIMARY KEY, parent_id TEXT, owner_id TEXT, sort_index INTEGER NOT NULL, document TEXT NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS goal_parent_idx ON goal(parent_id);",
      "CREATE INDEX IF NOT EXISTS goal_owner_idx ON goal(owner_id);",
      "CREATE TABLE IF NOT EXISTS goal_dependency (prerequisite_id TEXT NOT NULL, dependent_id TEXT NOT NULL, kind INTEGER NOT NULL, note TEXT, created_at_ms INTEGER NOT NULL, PRIMARY KEY (prerequisite_id, dependent_id), FOREIGN KEY(prerequisite_id) REFERENCES goal(id) ON DELETE CASCADE, FOREIGN KEY(dependent_id) REFERENCES goal(id) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS goal_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT id,parent_id,owner_id,sort_index,document,updated_at_ms FROM goal LIMIT 1;");
  db.Exec("SELECT prerequisite_id,dependent_id,kind,note,created_at_ms FROM goal_dependency LIMIT 1;");
}

// ------------------------------------------------------------------
// Goals
// ------------------------------------------------------------------

Result SqliteRepository::UpsertGoal(Transaction& t, const model::GoalRecord& r) {
  auto* db = TX(t).Handle();
  if (r.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "goal id must not be empty");

  Statement st(db,
               "INSERT INTO goal(id,parent_id,owner_id,sort_index,document,updated_at_ms) VALUES(?,?,?,?,?,?) "
               "ON CONFLICT(id) DO UPDATE SET parent_id=excluded.parent_id, owner_id=excluded.owner_id, "
               "sort_index=excluded.sort_index, document=excluded.document, updated_at_ms=excluded.updated_at_ms;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindOptionalText(st.get(), 2, r.parent_id);
  BindOptionalText(st.get(), 3, r.owner_id);
  BindI64(st.get(), 4, r.sort_index);
  BindText(st.get(), 5, r.document);
  BindU64(st.get(), 6, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::GoalRecord> SqliteRepository::GetGoal(Transaction& t, const std::string& id) {
  auto*       db  = TX(t).Handle();
  const auto  sql = std::string("SELECT ") + kGoalColumns + " FROM goal WHERE id=?;";
  Statement   st(db, sql.c_str());
  if (!st.Ok()) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadGoal(st.get());
}

std::vector<model::GoalRecord> SqliteRepository::ListGoals(Transaction& t) {
  auto*      db  = TX(t).Handle();
  const auto sql = std::string("SELECT ") + kGoalColumns + " FROM goal ORDER BY id;";
  Statement  st(db, sql.c_str());

  std::vector<model::GoalRecord> out;
  if (!st.Ok()) return out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadGoal(st.get()));
  }
  return out;
}

Result SqliteRepository::DeleteGoal(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  {
    Statement edges(db, "DELETE FROM goal_dependency WHERE prerequisite_id=? OR dependent_id=?;");
    if (!edges.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(edges.get(), 1, id);
    BindText(edges.get(), 2, id);
    auto res = Translate(db, sqlite3_step(edges.get()));
    if (!res) return res;
  }

  Statement st(db, "DELETE FROM goal WHERE id=?;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, id);
  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "goal not found: " + id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Dependencies
// ------------------------------------------------------------------

Result SqliteRepository::InsertDependency(Transaction& t, const model::DependencyRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO goal_dependency(prerequisite_id,dependent_id,kind,note,created_at_ms) VALUES(?,?,?,?,?);");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.prerequisite_id);
  BindText(st.get(), 2, r.dependent_id);
  sqlite3_bind_int(st.get(), 3, r.kind);
  if (r.note) {
    BindText(st.get(), 4, *r.note);
  } else {
    sqlite3_bind_null(st.get(), 4);
  }
  BindU64(st.get(), 5, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteDependency(Transaction& t, const std::string& prerequisite_id, const std::string& dependent_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM goal_dependency WHERE prerequisite_id=? AND dependent_id=?;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, prerequisite_id);
  BindText(st.get(), 2, dependent_id);
  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<model::DependencyRecord> SqliteRepository::ListDependencies(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT prerequisite_id,dependent_id,kind,note,created_at_ms FROM goal_dependency ORDER BY prerequisite_id,dependent_id;");

  std::vector<model::DependencyRecord> out;
  if (!st.Ok()) return out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::DependencyRecord r;
    r.prerequisite_id = ColText(st.get(), 0);
    r.dependent_id    = ColText(st.get(), 1);
    r.kind            = sqlite3_column_int(st.get(), 2);
    if (sqlite3_column_type(st.get(), 3) != SQLITE_NULL) {
      r.note = ColText(st.get(), 3);
    }
    r.created_at_ms = ColU64(st.get(), 4);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace goalgraph::db::sqlite
