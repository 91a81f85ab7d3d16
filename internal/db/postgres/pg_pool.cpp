#include "pg_pool.hpp"

#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mirrorwatch::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception& e) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw util::StorageError(std::string("postgres connect: ") + e.what());
  }
}

int PgPool::ApplySchema() {
  auto       conn = Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS mirrorwatch_schema (id INTEGER PRIMARY KEY CHECK (id = 1), version INTEGER NOT NULL)");
  // Serializes concurrent starts against the same database.
  tx.exec("LOCK TABLE mirrorwatch_schema IN EXCLUSIVE MODE");

  int        found = 0;
  const auto rows  = tx.exec("SELECT version FROM mirrorwatch_schema WHERE id = 1");
  if (!rows.empty()) found = rows[0][0].as<int>();
  if (found > sql::kSchemaVersion) {
    throw util::StorageError("postgres schema version " + std::to_string(found) + " is newer than supported version " +
                             std::to_string(sql::kSchemaVersion));
  }

  for (const auto* statement : sql::kPostgresSchema) tx.exec(statement);
  tx.exec("INSERT INTO mirrorwatch_schema(id, version) VALUES (1, " + std::to_string(sql::kSchemaVersion) +
          ") ON CONFLICT (id) DO UPDATE SET version = EXCLUDED.version");
  tx.commit();

  if (found != sql::kSchemaVersion) {
    MIRRORWATCH_LOG_INFO("postgres schema applied", {observability::IntField("from_version", found), observability::IntField("to_version", sql::kSchemaVersion)});
  }
  return found;
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_instance",
               "INSERT INTO instances(domain,url,country,is_additional,is_bad_host,enabled,missed_passes,created_at_ms,updated_at_ms)"
               " VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) RETURNING id");

  conn.prepare("update_instance",
               "UPDATE instances SET domain=$2,url=$3,country=$4,is_additional=$5,is_bad_host=$6,enabled=$7,missed_passes=$8,updated_at_ms=$9"
               " WHERE id=$1");

  conn.prepare("insert_health_check",
               "INSERT INTO health_checks(instance_id,checked_at_ms,healthy,response_time_ms,http_status,version,version_url,"
               "is_upstream,is_latest_version,rss,connectivity) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11)");

  conn.prepare("insert_error",
               "INSERT INTO check_errors(instance_id,occurred_at_ms,category,message,http_status,http_body) VALUES($1,$2,$3,$4,$5,$6)");

  conn.prepare("trim_errors",
               "DELETE FROM check_errors WHERE instance_id=$1 AND id NOT IN"
               " (SELECT id FROM check_errors WHERE instance_id=$1 ORDER BY occurred_at_ms DESC, id DESC LIMIT $2)");

  conn.prepare("insert_stats_counter",
               "INSERT INTO instance_stats(instance_id,collected_at_ms,counter,value) VALUES($1,$2,$3,$4)"
               " ON CONFLICT(instance_id,collected_at_ms,counter) DO UPDATE SET value=EXCLUDED.value");

  conn.prepare("upsert_upstream_version",
               "INSERT INTO upstream_version(id,commit_sha,branch,refreshed_at_ms) VALUES(1,$1,$2,$3)"
               " ON CONFLICT(id) DO UPDATE SET commit_sha=EXCLUDED.commit_sha,branch=EXCLUDED.branch,refreshed_at_ms=EXCLUDED.refreshed_at_ms");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace mirrorwatch::db::postgres
