#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using mirrorwatch::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "mirrorwatch_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    ConfigLoader::LoadFromYamlString(yaml);
  } catch (const mirrorwatch::util::ConfigurationError&) {
    return true;
  }
  return false;
}

void TestEmptyDocumentGetsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");

  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.scanner().probe_interval().seconds() == 900);
  assert(config.scanner().tick_deadline().seconds() == 720);
  assert(config.scanner().workers() == 16);
  assert(!config.scanner().disable_health_checks());
  assert(config.registry().retire_after_missed_passes() == 0);
  assert(config.probe().profile_path() == "/jack");
  assert(config.probe().rss_path() == "/jack/rss");
  assert(config.probe().about_path() == "/about");
  assert(config.upstream().branch() == "master");
  assert(config.retention().error_retention_per_host() == 20);
  assert(config.retention().health_check_horizon().seconds() == 0);
  assert(config.stats().path() == "/.health");
  assert(config.scoring().recent_window_hours() == 3);
  assert(config.scoring().weight_recent() == 0.3);
  assert(config.scoring().weight_version() == 0.1);
  assert(config.scoring().scale_by_recent());
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
}

void TestFileIsLoadedAndDurationsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:7000"
database:
  sqlite:
    path: "/tmp/mirrorwatch.db"
    wal_mode: true
scanner:
  probe_interval: "600s"
  tick_deadline: "300s"
  workers: 4
  auto_mute: true
registry:
  additional_hosts:
    - "extra.example"
  bad_hosts:
    - "bad.example"
  retire_after_missed_passes: 3
probe:
  profile_name: "jack"
retention:
  health_check_horizon: "31536000s"
instance_overrides:
  - domain: "custom.example"
    profile_path: "/elonmusk"
    bearer_token: "secret"
scoring:
  scale_by_recent: false
  weight_version: 0
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.database().sqlite().path() == "/tmp/mirrorwatch.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.scanner().probe_interval().seconds() == 600);
  assert(config.scanner().tick_deadline().seconds() == 300);
  assert(config.scanner().workers() == 4);
  assert(config.scanner().auto_mute());
  assert(config.registry().additional_hosts_size() == 1);
  assert(config.registry().bad_hosts(0) == "bad.example");
  assert(config.registry().retire_after_missed_passes() == 3);
  assert(config.probe().profile_name() == "jack");
  assert(config.instance_overrides_size() == 1);
  assert(config.instance_overrides(0).bearer_token() == "secret");
  // explicitly set optional values survive the defaults pass
  assert(!config.scoring().scale_by_recent());
  assert(config.scoring().weight_version() == 0.0);
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(probe:
  profile_name: "12345"
database:
  sqlite:
    path: "C:\\mirror\\\"quoted\"\\db.sqlite"
)");
  assert(config.probe().profile_name() == "12345");
  assert(config.database().sqlite().path() == "C:\\mirror\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("unknown_field: 123\n"));
  assert(Rejects("scanner:\n  worker_count: 3\n"));
}

void TestTopLevelMustBeMapping() {
  assert(Rejects("- a\n- b\n"));
}

void TestValidationFailures() {
  assert(Rejects("scanner:\n  probe_interval: \"-5s\"\n"));
  assert(Rejects("scanner:\n  probe_interval: \"60s\"\n  tick_deadline: \"120s\"\n"));
  assert(Rejects("probe:\n  profile_path: \"jack\"\n"));
  assert(Rejects("probe:\n  rss_marker: \"(unclosed\"\n"));
  assert(Rejects("scoring:\n  weight_month: -0.5\n"));
  assert(Rejects("retention:\n  health_check_horizon: \"86400s\"\n"));
  assert(Rejects("instance_overrides:\n  - profile_path: \"/x\"\n"));
  assert(Rejects("instance_overrides:\n  - domain: \"a.example\"\n    stats_path: \"health\"\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 2\n"));
}

void TestDisabledStatsSkipsStatsValidation() {
  auto config = ConfigLoader::LoadFromYamlString("stats:\n  disabled: true\n");
  assert(config.stats().disabled());
}

void TestMissingFileIsConfigurationError() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/mirrorwatch/config.yaml");
  } catch (const mirrorwatch::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyDocumentGetsDefaults();
  TestFileIsLoadedAndDurationsParsed();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestTopLevelMustBeMapping();
  TestValidationFailures();
  TestDisabledStatsSkipsStatsValidation();
  TestMissingFileIsConfigurationError();

  std::cout << "config_loader_test: pass\n";
  return 0;
}
