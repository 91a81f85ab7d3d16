#pragma once

namespace mirrorwatch::db::sql {

/*
  Canonical SQL used by the SQLite backend. The Postgres backend prepares
  the same statements with $n placeholders (see PgPool).
*/

// instances

static constexpr const char* INSERT_INSTANCE =
    "INSERT INTO instances(domain,url,country,is_additional,is_bad_host,enabled,missed_passes,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* UPDATE_INSTANCE =
    "UPDATE instances SET domain=?,url=?,country=?,is_additional=?,is_bad_host=?,enabled=?,missed_passes=?,updated_at_ms=?"
    " WHERE id=?;";

static constexpr const char* INSTANCE_COLUMNS =
    "SELECT id,domain,url,country,is_additional,is_bad_host,enabled,missed_passes,created_at_ms,updated_at_ms FROM instances";

// health checks

static constexpr const char* INSERT_HEALTH_CHECK =
    "INSERT INTO health_checks(instance_id,checked_at_ms,healthy,response_time_ms,http_status,version,version_url,"
    "is_upstream,is_latest_version,rss,connectivity) VALUES(?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* HEALTH_CHECK_COLUMNS =
    "SELECT h.instance_id,h.checked_at_ms,h.healthy,h.response_time_ms,h.http_status,h.version,h.version_url,"
    "h.is_upstream,h.is_latest_version,h.rss,h.connectivity FROM health_checks h";

static constexpr const char* LATEST_HEALTH_CHECKS_JOIN =
    " JOIN (SELECT instance_id, MAX(checked_at_ms) AS last_at FROM health_checks GROUP BY instance_id) l"
    " ON l.instance_id=h.instance_id AND l.last_at=h.checked_at_ms"
    " ORDER BY h.instance_id;";

static constexpr const char* LAST_HEALTHY_AT =
    "SELECT MAX(checked_at_ms) FROM health_checks WHERE instance_id=? AND healthy<>0;";

static constexpr const char* LAST_HEALTH_CHECK_AT =
    "SELECT MAX(checked_at_ms) FROM health_checks;";

static constexpr const char* DELETE_HEALTH_CHECKS_BEFORE =
    "DELETE FROM health_checks WHERE checked_at_ms<?;";

// errors

static constexpr const char* INSERT_ERROR =
    "INSERT INTO check_errors(instance_id,occurred_at_ms,category,message,http_status,http_body) VALUES(?,?,?,?,?,?);";

static constexpr const char* LIST_ERRORS =
    "SELECT instance_id,occurred_at_ms,category,message,http_status,http_body FROM check_errors"
    " WHERE instance_id=? ORDER BY occurred_at_ms DESC, id DESC LIMIT ?;";

static constexpr const char* COUNT_ERRORS =
    "SELECT COUNT(*) FROM check_errors WHERE instance_id=?;";

static constexpr const char* TRIM_ERRORS =
    "DELETE FROM check_errors WHERE instance_id=? AND id NOT IN"
    " (SELECT id FROM check_errors WHERE instance_id=? ORDER BY occurred_at_ms DESC, id DESC LIMIT ?);";

// stats

static constexpr const char* INSERT_STATS_COUNTER =
    "INSERT INTO instance_stats(instance_id,collected_at_ms,counter,value) VALUES(?,?,?,?)"
    " ON CONFLICT(instance_id,collected_at_ms,counter) DO UPDATE SET value=excluded.value;";

static constexpr const char* STATS_COLUMNS =
    "SELECT instance_id,collected_at_ms,counter,value FROM instance_stats";

static constexpr const char* LAST_STATS_AT =
    "SELECT MAX(collected_at_ms) FROM instance_stats;";

// upstream

static constexpr const char* UPSERT_UPSTREAM_VERSION =
    "INSERT INTO upstream_version(id,commit_sha,branch,refreshed_at_ms) VALUES(1,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET commit_sha=excluded.commit_sha,branch=excluded.branch,refreshed_at_ms=excluded.refreshed_at_ms;";

static constexpr const char* SELECT_UPSTREAM_VERSION =
    "SELECT commit_sha,branch,refreshed_at_ms FROM upstream_version WHERE id=1;";

} // namespace mirrorwatch::db::sql
