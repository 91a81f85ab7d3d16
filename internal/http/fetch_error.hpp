#pragma once

#include <optional>
#include <string>
#include <variant>

#include "api/mirrorwatch/v1.hpp"
#include "http_client.hpp"

namespace mirrorwatch::http {

/*
  A failed fetch, classified.

  Known failure pages (blocked, rate limited, gateway errors) keep only the
  status; unexpected statuses keep the body for diagnosis.
*/
struct FetchError {
  v1::ErrorCategory  category = v1::ERROR_CATEGORY_UNSPECIFIED;
  std::string        message;
  std::optional<int> http_status;
  std::string        body;
};

using FetchOutcome = std::variant<HttpResponse, FetchError>;

// nullopt for a 2xx response.
std::optional<FetchError> ClassifyResult(const HttpResult& result);

// Runs the request and classifies anything but a 2xx response.
FetchOutcome Fetch(HttpClient& client, const HttpRequest& request);

std::string CategoryName(v1::ErrorCategory category);

} // namespace mirrorwatch::http
