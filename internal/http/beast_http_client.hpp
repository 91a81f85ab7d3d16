#pragma once

#include <memory>
#include <string>

#include "http_client.hpp"

namespace mirrorwatch::http {

struct ClientOptions {
  std::string user_agent = "mirrorwatch";
  unsigned    max_redirects = 3;
  bool        verify_tls = true;
};

/*
  HttpClient over Boost.Beast.

  Every call owns its io_context and socket, so concurrent calls share
  nothing but the TLS context. The request timeout bounds the whole call
  including redirects.
*/
class BeastHttpClient final : public HttpClient {
 public:
  explicit BeastHttpClient(ClientOptions options);
  ~BeastHttpClient() override;

  HttpResult Get(const HttpRequest& request) override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// Fixed browser-like headers sent with every request.
Headers DefaultHeaders(const std::string& user_agent);

// "mirrorwatch (+<site_url>/about)"
std::string UserAgentFor(const std::string& site_url);

} // namespace mirrorwatch::http
