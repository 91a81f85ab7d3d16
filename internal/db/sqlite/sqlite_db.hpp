#pragma once

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace mirrorwatch::db::sqlite {

/*
  Owns the single sqlite3 connection of a monitor database.

  Every transaction shares it; TxMutex() serializes them since SQLite has
  no nested transactions on one connection. Failures surface as
  util::StorageError.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true, std::chrono::milliseconds busy_timeout = std::chrono::seconds(5));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  void Exec(const std::string& sql);

  // Caller owns the statement (sqlite3_finalize).
  sqlite3_stmt* Prepare(const std::string& sql);

  /*
    Creates the monitor tables and stamps PRAGMA user_version with
    sql::kSchemaVersion. Idempotent; refuses a file written by a newer
    schema. Returns the version found before the call (0 for a new file).
  */
  int ApplySchema();

 private:
  int64_t QueryInt(const std::string& sql);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace mirrorwatch::db::sqlite
