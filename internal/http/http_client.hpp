#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mirrorwatch::http {

using Headers = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
  std::string               url;
  Headers                   headers;
  std::chrono::milliseconds timeout{10000};
};

struct HttpResponse {
  unsigned                  status = 0;
  std::string               body;
  std::string               final_url;
  std::chrono::milliseconds elapsed{0};
};

/*
  Outcome of one GET.

  Exactly one of `response` and `error` is meaningful: a transport failure
  (DNS, connect, TLS, timeout) leaves `response` empty. Any HTTP status,
  including 4xx/5xx, is a response.
*/
struct HttpResult {
  std::optional<HttpResponse> response;
  std::string                 error;
  bool                        timed_out = false;

  bool Ok() const {
    return response.has_value();
  }
};

/*
  Blocking HTTP client seam.

  Implementations must be safe to call from several worker threads at once
  and must never throw for network reasons.
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResult Get(const HttpRequest& request) = 0;
};

} // namespace mirrorwatch::http
