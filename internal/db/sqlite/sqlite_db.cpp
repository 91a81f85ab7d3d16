#include "sqlite_db.hpp"

#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mirrorwatch::db::sqlite {

namespace {

[[noreturn]] void Fail(sqlite3* db, const std::string& what) {
  throw util::StorageError("sqlite " + what + ": " + (db != nullptr ? sqlite3_errmsg(db) : "out of memory"));
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  if (sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
    const std::string msg = db_ != nullptr ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageError("sqlite open " + path_ + ": " + msg);
  }

  try {
    // The read API queries while probe results are written; WAL keeps
    // readers off the writer's lock.
    if (wal_mode) Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
    Exec("PRAGMA foreign_keys=ON;");
    Exec("PRAGMA temp_store=MEMORY;");
    if (sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count())) != SQLITE_OK) Fail(db_, "busy_timeout");
  } catch (const util::StorageError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    const std::string msg = err != nullptr ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw util::StorageError("sqlite exec: " + msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) Fail(db_, "prepare");
  return stmt;
}

int64_t SqliteDB::QueryInt(const std::string& sql) {
  sqlite3_stmt* stmt = Prepare(sql);
  const int     rc   = sqlite3_step(stmt);
  int64_t       out  = rc == SQLITE_ROW ? sqlite3_column_int64(stmt, 0) : 0;
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) Fail(db_, "query");
  return out;
}

int SqliteDB::ApplySchema() {
  std::lock_guard lock(tx_mutex_);

  const auto found = static_cast<int>(QueryInt("PRAGMA user_version;"));
  if (found > sql::kSchemaVersion) {
    throw util::StorageError(path_ + " has schema version " + std::to_string(found) + ", this build supports up to " +
                             std::to_string(sql::kSchemaVersion));
  }

  Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto* statement : sql::kSqliteSchema) Exec(statement);
    Exec("PRAGMA user_version=" + std::to_string(sql::kSchemaVersion) + ";");
    Exec("COMMIT;");
  } catch (const util::StorageError&) {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }

  if (found != sql::kSchemaVersion) {
    MIRRORWATCH_LOG_INFO("sqlite schema applied", {observability::StringField("path", path_), observability::IntField("from_version", found),
                                                   observability::IntField("to_version", sql::kSchemaVersion)});
  }
  return found;
}

} // namespace mirrorwatch::db::sqlite
