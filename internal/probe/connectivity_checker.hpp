#pragma once

#include <chrono>
#include <string>

#include "mirrorwatch/v1/types.pb.h"

namespace mirrorwatch::probe {

class ConnectivityChecker {
 public:
  virtual ~ConnectivityChecker() = default;

  virtual v1::Connectivity Check(const std::string& host, std::chrono::milliseconds timeout) = 0;
};

/*
  Resolves A and AAAA records separately and, when `connect` is set, only
  counts a family whose addresses accept a TCP connection on `port`.
*/
class AsioConnectivityChecker final : public ConnectivityChecker {
 public:
  AsioConnectivityChecker(bool connect, unsigned port);

  v1::Connectivity Check(const std::string& host, std::chrono::milliseconds timeout) override;

 private:
  bool     connect_;
  unsigned port_;
};

v1::Connectivity Classify(bool ipv4, bool ipv6);

} // namespace mirrorwatch::probe
