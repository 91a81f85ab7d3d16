#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdlib>
#include <regex>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace mirrorwatch::config {

using mirrorwatch::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultListUrl  = "https://github.com/zedeus/nitter/wiki/Instances";
constexpr const char* kDefaultGitUrl   = "https://github.com/zedeus/nitter.git";
constexpr const char* kDefaultWebUrl   = "https://github.com/zedeus/nitter/commit/";
constexpr const char* kDefaultCompare  = "https://api.github.com/repos/zedeus/nitter/compare/{base}...{head}";
constexpr uint64_t    kScoringWindowMs = 120ull * util::kMillisPerDay;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw util::ConfigurationError("Unsupported YAML node");
  }
}

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  // An empty document is a valid all-defaults configuration.
  if (json_value.has_struct_value()) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw util::ConfigurationError("Invalid configuration: " + std::string(status.message()));
    }
  } else if (!yaml.IsNull()) {
    throw util::ConfigurationError("Invalid configuration: top level must be a mapping");
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

void DefaultDuration(google::protobuf::Duration* d, std::chrono::seconds value) {
  if (d->seconds() == 0 && d->nanos() == 0) {
    d->set_seconds(value.count());
  }
}

void DefaultString(std::string* field, const char* value) {
  if (field->empty()) {
    *field = value;
  }
}

void RequirePositive(const google::protobuf::Duration& d, const char* name) {
  if (d.seconds() < 0 || (d.seconds() == 0 && d.nanos() <= 0)) {
    throw util::ConfigurationError(std::string(name) + " must be positive");
  }
}

void RequirePath(const std::string& path, const std::string& name) {
  if (path.empty() || path.front() != '/') {
    throw util::ConfigurationError(name + " must start with '/'");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& document) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(document);
  } catch (const std::exception& e) {
    throw util::ConfigurationError("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  DefaultString(config.mutable_server()->mutable_bind_address(), "0.0.0.0:50061");
  DefaultString(config.mutable_logging()->mutable_level(), "info");

  if (config.database().has_sqlite()) {
    DefaultString(config.mutable_database()->mutable_sqlite()->mutable_path(), "mirrorwatch.db");
  }
  if (config.database().has_postgres() && config.database().postgres().max_connections() == 0) {
    config.mutable_database()->mutable_postgres()->set_max_connections(4);
  }

  auto* scanner = config.mutable_scanner();
  DefaultDuration(scanner->mutable_probe_interval(), std::chrono::seconds(900));
  DefaultDuration(scanner->mutable_probe_timeout(), std::chrono::seconds(30));
  DefaultDuration(scanner->mutable_request_timeout(), std::chrono::seconds(10));
  // The deadline defaults to 80% of the probe interval.
  if (!scanner->has_tick_deadline()) {
    const auto interval = util::ToMillis(scanner->probe_interval());
    *scanner->mutable_tick_deadline() = util::ToProtoDuration(interval * 4 / 5);
  }
  if (scanner->workers() == 0) scanner->set_workers(16);
  if (scanner->max_redirects() == 0) scanner->set_max_redirects(3);
  DefaultString(scanner->mutable_site_url(), "http://localhost");

  auto* registry = config.mutable_registry();
  DefaultString(registry->mutable_list_url(), kDefaultListUrl);
  DefaultDuration(registry->mutable_refresh_interval(), std::chrono::seconds(3600));

  auto* probe = config.mutable_probe();
  DefaultString(probe->mutable_profile_path(), "/jack");
  DefaultString(probe->mutable_rss_path(), "/jack/rss");
  DefaultString(probe->mutable_about_path(), "/about");
  if (probe->profile_posts_min() == 0) probe->set_profile_posts_min(5);
  DefaultString(probe->mutable_rss_marker(), "<rss");
  if (probe->connectivity_port() == 0) probe->set_connectivity_port(443);

  auto* upstream = config.mutable_upstream();
  DefaultString(upstream->mutable_git_url(), kDefaultGitUrl);
  DefaultString(upstream->mutable_branch(), "master");
  DefaultString(upstream->mutable_web_url(), kDefaultWebUrl);
  DefaultString(upstream->mutable_compare_url(), kDefaultCompare);
  DefaultDuration(upstream->mutable_refresh_interval(), std::chrono::seconds(3600));

  auto* retention = config.mutable_retention();
  if (retention->error_retention_per_host() == 0) retention->set_error_retention_per_host(20);
  DefaultDuration(retention->mutable_cleanup_interval(), std::chrono::seconds(3600));
  if (retention->max_error_body_bytes() == 0) retention->set_max_error_body_bytes(4096);

  auto* stats = config.mutable_stats();
  DefaultDuration(stats->mutable_interval(), std::chrono::seconds(900));
  DefaultString(stats->mutable_path(), "/.health");

  auto* scoring = config.mutable_scoring();
  if (scoring->recent_window_hours() == 0) scoring->set_recent_window_hours(3);
  if (scoring->ping_range_hours() == 0) scoring->set_ping_range_hours(3);
  if (!scoring->has_weight_recent()) scoring->set_weight_recent(0.3);
  if (!scoring->has_weight_month()) scoring->set_weight_month(0.2);
  if (!scoring->has_weight_long()) scoring->set_weight_long(0.2);
  if (!scoring->has_weight_version()) scoring->set_weight_version(0.1);
  if (!scoring->has_scale_by_recent()) scoring->set_scale_by_recent(true);
  if (scoring->recent_checks() == 0) scoring->set_recent_checks(22);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& scanner = config.scanner();
  RequirePositive(scanner.probe_interval(), "scanner.probe_interval");
  RequirePositive(scanner.tick_deadline(), "scanner.tick_deadline");
  RequirePositive(scanner.probe_timeout(), "scanner.probe_timeout");
  RequirePositive(scanner.request_timeout(), "scanner.request_timeout");
  if (util::ToMillis(scanner.tick_deadline()) > util::ToMillis(scanner.probe_interval())) {
    throw util::ConfigurationError("scanner.tick_deadline must not exceed scanner.probe_interval");
  }
  if (scanner.workers() == 0) {
    throw util::ConfigurationError("scanner.workers must be positive");
  }

  if (config.registry().list_url().empty()) {
    throw util::ConfigurationError("registry.list_url is required");
  }
  RequirePositive(config.registry().refresh_interval(), "registry.refresh_interval");

  const auto& probe = config.probe();
  RequirePath(probe.profile_path(), "probe.profile_path");
  RequirePath(probe.rss_path(), "probe.rss_path");
  RequirePath(probe.about_path(), "probe.about_path");
  try {
    std::regex(probe.rss_marker(), std::regex::icase);
  } catch (const std::regex_error& e) {
    throw util::ConfigurationError("probe.rss_marker is not a valid regular expression: " + std::string(e.what()));
  }

  for (const auto& o : config.instance_overrides()) {
    if (o.domain().empty()) {
      throw util::ConfigurationError("instance_overrides entry without domain");
    }
    const auto prefix = "instance_overrides[" + o.domain() + "].";
    if (!o.profile_path().empty()) RequirePath(o.profile_path(), prefix + "profile_path");
    if (!o.rss_path().empty()) RequirePath(o.rss_path(), prefix + "rss_path");
    if (!o.about_path().empty()) RequirePath(o.about_path(), prefix + "about_path");
    if (!o.stats_path().empty()) RequirePath(o.stats_path(), prefix + "stats_path");
  }

  const auto& upstream = config.upstream();
  if (upstream.git_url().empty() || upstream.branch().empty()) {
    throw util::ConfigurationError("upstream.git_url and upstream.branch are required");
  }
  RequirePositive(upstream.refresh_interval(), "upstream.refresh_interval");

  const auto& retention = config.retention();
  RequirePositive(retention.cleanup_interval(), "retention.cleanup_interval");
  if (retention.health_check_horizon().seconds() < 0) {
    throw util::ConfigurationError("retention.health_check_horizon must not be negative");
  }
  const auto horizon_ms = static_cast<uint64_t>(util::ToMillis(retention.health_check_horizon()).count());
  if (horizon_ms != 0 && horizon_ms <= kScoringWindowMs) {
    throw util::ConfigurationError("retention.health_check_horizon must exceed the 120 day scoring window");
  }

  if (!config.stats().disabled()) {
    RequirePositive(config.stats().interval(), "stats.interval");
    RequirePath(config.stats().path(), "stats.path");
  }

  const auto& scoring = config.scoring();
  if (scoring.weight_recent() < 0 || scoring.weight_month() < 0 || scoring.weight_long() < 0 || scoring.weight_version() < 0) {
    throw util::ConfigurationError("scoring weights must not be negative");
  }
  if (scoring.recent_window_hours() == 0 || scoring.ping_range_hours() == 0) {
    throw util::ConfigurationError("scoring windows must be positive");
  }

  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw util::ConfigurationError("database.postgres.connection_uri is required");
  }
}

} // namespace mirrorwatch::config
