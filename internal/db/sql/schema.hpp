#pragma once

#include <array>

namespace mirrorwatch::db::sql {

/*
  Bootstrap DDL, applied idempotently at startup.

  health_checks(instance_id, checked_at_ms) backs the "most recent N" and
  "count healthy in [t0,t1)" queries used by scoring.

  Bump kSchemaVersion whenever a statement below changes; a database stamped
  with a newer version than this build knows is refused.
*/

inline constexpr int kSchemaVersion = 1;

inline constexpr std::array<const char*, 9> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS instances ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT, domain TEXT NOT NULL UNIQUE, url TEXT NOT NULL, country TEXT NOT NULL DEFAULT '',"
    " is_additional INTEGER NOT NULL DEFAULT 0, is_bad_host INTEGER NOT NULL DEFAULT 0, enabled INTEGER NOT NULL DEFAULT 1,"
    " missed_passes INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS health_checks ("
    " instance_id INTEGER NOT NULL REFERENCES instances(id) ON DELETE CASCADE, checked_at_ms INTEGER NOT NULL,"
    " healthy INTEGER NOT NULL, response_time_ms INTEGER, http_status INTEGER, version TEXT, version_url TEXT,"
    " is_upstream INTEGER NOT NULL DEFAULT 0, is_latest_version INTEGER NOT NULL DEFAULT 0, rss INTEGER NOT NULL DEFAULT 0,"
    " connectivity INTEGER NOT NULL DEFAULT 0);",
    "CREATE INDEX IF NOT EXISTS health_checks_instance_time ON health_checks(instance_id, checked_at_ms);",
    "CREATE INDEX IF NOT EXISTS health_checks_time ON health_checks(checked_at_ms);",
    "CREATE TABLE IF NOT EXISTS check_errors ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT, instance_id INTEGER NOT NULL REFERENCES instances(id) ON DELETE CASCADE,"
    " occurred_at_ms INTEGER NOT NULL, category INTEGER NOT NULL, message TEXT NOT NULL, http_status INTEGER, http_body TEXT NOT NULL DEFAULT '');",
    "CREATE INDEX IF NOT EXISTS check_errors_instance_time ON check_errors(instance_id, occurred_at_ms);",
    "CREATE TABLE IF NOT EXISTS instance_stats ("
    " instance_id INTEGER NOT NULL REFERENCES instances(id) ON DELETE CASCADE, collected_at_ms INTEGER NOT NULL,"
    " counter TEXT NOT NULL, value INTEGER NOT NULL, PRIMARY KEY (instance_id, collected_at_ms, counter));",
    "CREATE INDEX IF NOT EXISTS instance_stats_time ON instance_stats(collected_at_ms);",
    "CREATE TABLE IF NOT EXISTS upstream_version ("
    " id INTEGER PRIMARY KEY CHECK (id = 1), commit_sha TEXT NOT NULL, branch TEXT NOT NULL, refreshed_at_ms INTEGER NOT NULL);",
};

inline constexpr std::array<const char*, 9> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS instances ("
    " id BIGSERIAL PRIMARY KEY, domain TEXT NOT NULL UNIQUE, url TEXT NOT NULL, country TEXT NOT NULL DEFAULT '',"
    " is_additional BOOLEAN NOT NULL DEFAULT FALSE, is_bad_host BOOLEAN NOT NULL DEFAULT FALSE, enabled BOOLEAN NOT NULL DEFAULT TRUE,"
    " missed_passes INTEGER NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS health_checks ("
    " instance_id BIGINT NOT NULL REFERENCES instances(id) ON DELETE CASCADE, checked_at_ms BIGINT NOT NULL,"
    " healthy BOOLEAN NOT NULL, response_time_ms BIGINT, http_status INTEGER, version TEXT, version_url TEXT,"
    " is_upstream BOOLEAN NOT NULL DEFAULT FALSE, is_latest_version BOOLEAN NOT NULL DEFAULT FALSE, rss BOOLEAN NOT NULL DEFAULT FALSE,"
    " connectivity SMALLINT NOT NULL DEFAULT 0);",
    "CREATE INDEX IF NOT EXISTS health_checks_instance_time ON health_checks(instance_id, checked_at_ms);",
    "CREATE INDEX IF NOT EXISTS health_checks_time ON health_checks(checked_at_ms);",
    "CREATE TABLE IF NOT EXISTS check_errors ("
    " id BIGSERIAL PRIMARY KEY, instance_id BIGINT NOT NULL REFERENCES instances(id) ON DELETE CASCADE,"
    " occurred_at_ms BIGINT NOT NULL, category SMALLINT NOT NULL, message TEXT NOT NULL, http_status INTEGER, http_body TEXT NOT NULL DEFAULT '');",
    "CREATE INDEX IF NOT EXISTS check_errors_instance_time ON check_errors(instance_id, occurred_at_ms);",
    "CREATE TABLE IF NOT EXISTS instance_stats ("
    " instance_id BIGINT NOT NULL REFERENCES instances(id) ON DELETE CASCADE, collected_at_ms BIGINT NOT NULL,"
    " counter TEXT NOT NULL, value BIGINT NOT NULL, PRIMARY KEY (instance_id, collected_at_ms, counter));",
    "CREATE INDEX IF NOT EXISTS instance_stats_time ON instance_stats(collected_at_ms);",
    "CREATE TABLE IF NOT EXISTS upstream_version ("
    " id INTEGER PRIMARY KEY CHECK (id = 1), commit_sha TEXT NOT NULL, branch TEXT NOT NULL, refreshed_at_ms BIGINT NOT NULL);",
};

} // namespace mirrorwatch::db::sql
