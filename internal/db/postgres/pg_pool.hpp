#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace mirrorwatch::db::postgres {

/*
  Bounded libpqxx connection pool behind PgRepository.

  A transaction holds one connection for its lifetime (pqxx connections are
  not thread-safe) and hands it back through the shared_ptr deleter. Broken
  connections are dropped instead of returned. Prepared statements are
  installed once per connection.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Blocks while every connection is in use. Throws util::StorageError
  // when a new connection cannot be opened.
  std::shared_ptr<pqxx::connection> Acquire();

  /*
    Creates the monitor tables and records sql::kSchemaVersion in
    mirrorwatch_schema. Refuses a database stamped by a newer build.
    Returns the version found before the call (0 for an empty database).
  */
  int ApplySchema();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace mirrorwatch::db::postgres
