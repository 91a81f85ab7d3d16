#include <google/protobuf/util/time_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include "api/mirrorwatch/v1.hpp"
#include "mirrorwatch/v1/status_service.grpc.pb.h"

using namespace mirrorwatch::v1;
using google::protobuf::util::TimeUtil;

static void Usage() {
  std::cout << "Usage:\n"
            << "  mirrorctl <addr> list [--all]\n"
            << "  mirrorctl <addr> instance <domain>\n"
            << "  mirrorctl <addr> history [domain|-] [hours=24] [bucket_minutes=60]\n"
            << "  mirrorctl <addr> stats [domain|-] [hours=24] [bucket_minutes=60]\n"
            << "  mirrorctl <addr> upstream\n";
}

static std::string Percent(bool has, double value) {
  if (!has) return "-";
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << value << "%";
  return out.str();
}

static std::string CommitStatusName(CommitStatus status) {
  switch (status) {
    case COMMIT_STATUS_CURRENT:
      return "current";
    case COMMIT_STATUS_OUTDATED:
      return "outdated";
    case COMMIT_STATUS_CUSTOM_BRANCH:
      return "custom";
    default:
      return "unknown";
  }
}

static void PrintInstance(const InstanceSnapshot& s) {
  std::cout << std::setw(4) << (s.rank() ? std::to_string(s.rank()) : std::string("-")) << "  " << std::left << std::setw(32) << s.domain()
            << std::right << "  " << (s.healthy_now() ? "up  " : "down") << "  points=" << std::setw(3) << s.points()
            << "  3h=" << Percent(s.has_pct_recent(), s.pct_recent()) << "  30d=" << Percent(s.has_pct_30d(), s.pct_30d())
            << "  ping=" << (s.has_avg_response_ms() ? std::to_string(s.avg_response_ms()) + "ms" : std::string("-"))
            << "  version=" << (s.version().empty() ? "-" : s.version()) << " (" << CommitStatusName(s.commit_status()) << ")"
            << (s.is_bad_host() ? "  [bad]" : "") << (s.stale() ? "  [stale]" : "") << "\n";
}

// Fills start/end/bucket of a history-style request from the trailing args.
template <typename Request>
static void FillWindow(Request& req, int argc, char** argv, int first) {
  if (argc > first && std::string(argv[first]) != "-") req.set_domain(argv[first]);

  const int64_t hours          = argc > first + 1 ? std::atoll(argv[first + 1]) : 24;
  const int64_t bucket_minutes = argc > first + 2 ? std::atoll(argv[first + 2]) : 60;

  const auto now     = TimeUtil::GetCurrentTime();
  *req.mutable_end()   = now;
  *req.mutable_start() = now - TimeUtil::HoursToDuration(hours);
  *req.mutable_bucket() = TimeUtil::MinutesToDuration(bucket_minutes);
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = StatusService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListInstancesRequest req;
    req.set_include_disabled(argc >= 4 && std::string(argv[3]) == "--all");

    ListInstancesResponse resp;

    auto status = stub->ListInstances(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& instance : resp.instances()) PrintInstance(instance);
    std::cout << "upstream=" << (resp.upstream().commit().empty() ? "unknown" : resp.upstream().commit()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "instance") {
    if (argc < 4) return 1;

    GetInstanceRequest req;
    req.set_domain(argv[3]);

    GetInstanceResponse resp;

    auto status = stub->GetInstance(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    PrintInstance(resp.instance());
    std::cout << "recent:";
    for (const auto& check : resp.instance().recent_checks()) std::cout << (check.healthy() ? " +" : " -");
    std::cout << "\n";
    for (const auto& error : resp.errors()) {
      std::cout << TimeUtil::ToString(error.occurred_at()) << "  " << ErrorCategory_Name(error.category()) << "  " << error.message();
      if (error.http_status()) std::cout << " (HTTP " << error.http_status() << ")";
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "history") {
    HealthHistoryRequest req;
    FillWindow(req, argc, argv, 3);

    HealthHistoryResponse resp;

    auto status = stub->QueryHealthHistory(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& bucket : resp.buckets()) {
      std::cout << TimeUtil::ToString(bucket.start()) << "  healthy=" << bucket.healthy() << "  dead=" << bucket.dead();
      if (bucket.has_avg_response_ms()) std::cout << "  ping=" << static_cast<int64_t>(bucket.avg_response_ms()) << "ms";
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest req;
    FillWindow(req, argc, argv, 3);

    StatsResponse resp;

    auto status = stub->QueryStats(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& bucket : resp.buckets()) {
      std::cout << TimeUtil::ToString(bucket.start());
      for (const auto& counter : bucket.counters()) {
        std::cout << "  " << counter.name() << "=" << static_cast<int64_t>(counter.avg());
      }
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "upstream") {
    GetUpstreamRequest req;
    UpstreamInfo       resp;

    auto status = stub->GetUpstream(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "branch=" << resp.branch() << "\n";
    std::cout << "commit=" << (resp.commit().empty() ? "unknown" : resp.commit()) << "\n";
    if (resp.has_refreshed_at()) std::cout << "refreshed_at=" << TimeUtil::ToString(resp.refreshed_at()) << "\n";
    return 0;
  }

  Usage();
  return 1;
}
