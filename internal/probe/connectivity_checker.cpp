#include "connectivity_checker.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "internal/observability/logging.hpp"

namespace mirrorwatch::probe {

namespace net = boost::asio;
using tcp     = boost::asio::ip::tcp;

namespace {

// Resolves (and optionally connects) over one address family. Both families
// share one io_context so they run side by side.
struct FamilyProbe {
  FamilyProbe(net::io_context& ioc, tcp family) : family(family), resolver(ioc), socket(ioc) {
  }

  void Start(const std::string& host, unsigned port, bool connect) {
    resolver.async_resolve(family, host, std::to_string(port), [this, connect](const boost::system::error_code& ec, tcp::resolver::results_type results) {
      if (ec || results.empty()) return;
      if (!connect) {
        reachable = true;
        return;
      }
      net::async_connect(socket, results, [this](const boost::system::error_code& connect_ec, const tcp::endpoint&) {
        reachable = !connect_ec;
      });
    });
  }

  void Cancel() {
    resolver.cancel();
    boost::system::error_code ignored;
    socket.close(ignored);
  }

  tcp           family;
  tcp::resolver resolver;
  tcp::socket   socket;
  bool          reachable = false;
};

} // namespace

v1::Connectivity Classify(bool ipv4, bool ipv6) {
  if (ipv4 && ipv6) return v1::CONNECTIVITY_ALL;
  if (ipv4) return v1::CONNECTIVITY_IPV4;
  if (ipv6) return v1::CONNECTIVITY_IPV6;
  return v1::CONNECTIVITY_UNKNOWN;
}

AsioConnectivityChecker::AsioConnectivityChecker(bool connect, unsigned port) : connect_(connect), port_(port) {
}

v1::Connectivity AsioConnectivityChecker::Check(const std::string& host, std::chrono::milliseconds timeout) {
  try {
    net::io_context ioc;
    FamilyProbe     v4(ioc, tcp::v4());
    FamilyProbe     v6(ioc, tcp::v6());
    v4.Start(host, port_, connect_);
    v6.Start(host, port_, connect_);

    ioc.run_for(timeout);
    if (!ioc.stopped()) {
      v4.Cancel();
      v6.Cancel();
      ioc.restart();
      ioc.run();
    }
    return Classify(v4.reachable, v6.reachable);
  } catch (const std::exception& e) {
    MIRRORWATCH_LOG_DEBUG("connectivity check failed", {observability::StringField("host", host), observability::StringField("error", e.what())});
    return v1::CONNECTIVITY_UNKNOWN;
  }
}

} // namespace mirrorwatch::probe
