#include "beast_http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "url.hpp"

namespace mirrorwatch::http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace net   = boost::asio;
namespace ssl   = boost::asio::ssl;
using tcp       = boost::asio::ip::tcp;

using SteadyClock = std::chrono::steady_clock;

namespace {

constexpr std::size_t kMaxBodyBytes = 8 * 1024 * 1024;

// Runs one async operation to completion on `ioc`. Operations on a
// beast::tcp_stream carry their own expiry, so only the resolver needs
// `cancel` to enforce the deadline.
template <typename Start, typename Cancel>
beast::error_code RunStep(net::io_context& ioc, SteadyClock::time_point deadline, Start&& start, Cancel&& cancel) {
  beast::error_code ec;
  bool              done = false;
  start([&](beast::error_code e, auto&&...) {
    ec   = e;
    done = true;
  });

  ioc.restart();
  ioc.run_until(deadline);
  if (!done) {
    cancel();
    ioc.restart();
    ioc.run();
    return beast::error::timeout;
  }
  return ec;
}

bool IsRedirect(unsigned status) {
  return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

struct Exchange {
  unsigned    status = 0;
  std::string body;
  std::string location;
};

} // namespace

struct BeastHttpClient::Impl {
  ClientOptions options;
  ssl::context  tls{ssl::context::tls_client};

  beast::error_code RoundTrip(const Url& url, const HttpRequest& request, SteadyClock::time_point deadline, Exchange& out);

  template <typename Stream>
  beast::error_code WriteAndRead(net::io_context& ioc, Stream& stream, beast::tcp_stream& lowest, const Url& url, const HttpRequest& request,
                                 SteadyClock::time_point deadline, Exchange& out);
};

template <typename Stream>
beast::error_code BeastHttpClient::Impl::WriteAndRead(net::io_context& ioc, Stream& stream, beast::tcp_stream& lowest, const Url& url,
                                                      const HttpRequest& request, SteadyClock::time_point deadline, Exchange& out) {
  bhttp::request<bhttp::empty_body> req{bhttp::verb::get, url.target, 11};
  const bool default_port = (url.scheme == "https" && url.port == "443") || (url.scheme == "http" && url.port == "80");
  req.set(bhttp::field::host, default_port ? url.host : url.host + ":" + url.port);
  for (const auto& [name, value] : DefaultHeaders(options.user_agent)) req.set(name, value);
  for (const auto& [name, value] : request.headers) req.set(name, value);

  lowest.expires_at(deadline);
  auto ec = RunStep(
      ioc, deadline, [&](auto handler) { bhttp::async_write(stream, req, handler); }, [&] { lowest.cancel(); });
  if (ec) return ec;

  beast::flat_buffer                         buffer;
  bhttp::response_parser<bhttp::string_body> parser;
  parser.body_limit(kMaxBodyBytes);
  ec = RunStep(
      ioc, deadline, [&](auto handler) { bhttp::async_read(stream, buffer, parser, handler); }, [&] { lowest.cancel(); });
  if (ec) return ec;

  const auto& res = parser.get();
  out.status      = res.result_int();
  out.body        = res.body();
  if (auto it = res.find(bhttp::field::location); it != res.end()) {
    out.location = std::string(it->value());
  }
  return {};
}

beast::error_code BeastHttpClient::Impl::RoundTrip(const Url& url, const HttpRequest& request, SteadyClock::time_point deadline, Exchange& out) {
  net::io_context ioc;
  tcp::resolver   resolver(ioc);

  tcp::resolver::results_type endpoints;
  auto                        ec = RunStep(
      ioc, deadline,
      [&](auto handler) {
        resolver.async_resolve(url.host, url.port, [&endpoints, handler](beast::error_code e, tcp::resolver::results_type results) mutable {
          endpoints = std::move(results);
          handler(e);
        });
      },
      [&] { resolver.cancel(); });
  if (ec) return ec;

  if (url.scheme == "http") {
    beast::tcp_stream stream(ioc);
    stream.expires_at(deadline);
    ec = RunStep(
        ioc, deadline, [&](auto handler) { stream.async_connect(endpoints, handler); }, [&] { stream.cancel(); });
    if (ec) return ec;

    ec = WriteAndRead(ioc, stream, stream, url, request, deadline, out);
    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    return ec;
  }

  beast::ssl_stream<beast::tcp_stream> stream(ioc, tls);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
    return beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
  }
  stream.set_verify_mode(options.verify_tls ? ssl::verify_peer : ssl::verify_none);
  if (options.verify_tls) {
    stream.set_verify_callback(ssl::host_name_verification(url.host));
  }

  auto& lowest = beast::get_lowest_layer(stream);
  lowest.expires_at(deadline);
  ec = RunStep(
      ioc, deadline, [&](auto handler) { lowest.async_connect(endpoints, handler); }, [&] { lowest.cancel(); });
  if (ec) return ec;

  ec = RunStep(
      ioc, deadline, [&](auto handler) { stream.async_handshake(ssl::stream_base::client, handler); }, [&] { lowest.cancel(); });
  if (ec) return ec;

  ec = WriteAndRead(ioc, stream, lowest, url, request, deadline, out);
  // Many servers drop the connection without close_notify; the response is complete either way.
  beast::error_code ignored;
  lowest.socket().shutdown(tcp::socket::shutdown_both, ignored);
  return ec;
}

BeastHttpClient::BeastHttpClient(ClientOptions options) : impl_(std::make_unique<Impl>()) {
  impl_->options = std::move(options);
  impl_->tls.set_default_verify_paths();
  impl_->tls.set_verify_mode(impl_->options.verify_tls ? ssl::verify_peer : ssl::verify_none);
}

BeastHttpClient::~BeastHttpClient() = default;

HttpResult BeastHttpClient::Get(const HttpRequest& request) {
  const auto start    = SteadyClock::now();
  const auto deadline = start + request.timeout;

  HttpResult  result;
  std::string current = request.url;

  for (unsigned hop = 0;; ++hop) {
    auto url = ParseUrl(current);
    if (!url) {
      result.error = "invalid url: " + current;
      return result;
    }

    Exchange exchange;
    beast::error_code ec;
    try {
      ec = impl_->RoundTrip(*url, request, deadline, exchange);
    } catch (const std::exception& e) {
      result.error = e.what();
      return result;
    }

    if (ec) {
      result.timed_out = ec == beast::error::timeout || SteadyClock::now() >= deadline;
      result.error     = result.timed_out ? "request timed out" : ec.message();
      return result;
    }

    if (IsRedirect(exchange.status) && !exchange.location.empty() && hop < impl_->options.max_redirects) {
      current = ResolveLocation(*url, exchange.location);
      continue;
    }

    HttpResponse response;
    response.status    = exchange.status;
    response.body      = std::move(exchange.body);
    response.final_url = url->ToString();
    response.elapsed   = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
    result.response    = std::move(response);
    return result;
  }
}

Headers DefaultHeaders(const std::string& user_agent) {
  return {
      {"User-Agent", user_agent},
      {"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,image/avif,image/webp,*/*;q=0.8"},
      {"Accept-Language", "de,en-US;q=0.7,en;q=0.3"},
      {"Sec-Fetch-Dest", "document"},
      {"Sec-Fetch-Mode", "navigate"},
      {"Sec-Fetch-Site", "none"},
      {"Sec-Fetch-User", "?1"},
      {"TE", "trailers"},
  };
}

std::string UserAgentFor(const std::string& site_url) {
  std::string base = site_url;
  while (!base.empty() && base.back() == '/') base.pop_back();
  return "mirrorwatch (+" + base + "/about)";
}

} // namespace mirrorwatch::http
