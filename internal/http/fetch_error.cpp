#include "fetch_error.hpp"

namespace mirrorwatch::http {

namespace {

constexpr const char* kCaptchaMarker     = "Enable JavaScript and cookies to continue";
constexpr const char* kBlockedMarker     = "You have been blocked";
constexpr const char* kRateLimitedMarker = "Instance has been rate limited";

bool IsKnownStatus(unsigned status, const std::string& body) {
  switch (status) {
    case 403:
      return body.find(kBlockedMarker) != std::string::npos;
    case 429:
      return body.find(kRateLimitedMarker) != std::string::npos;
    case 404:
    case 502:
    case 503:
    case 504:
      return true;
    default:
      return status >= 520 && status <= 527;
  }
}

} // namespace

std::optional<FetchError> ClassifyResult(const HttpResult& result) {
  if (!result.response) {
    FetchError error;
    error.category = result.timed_out ? v1::ERROR_CATEGORY_DEADLINE : v1::ERROR_CATEGORY_TRANSIENT_NETWORK;
    error.message  = result.error.empty() ? "request failed" : result.error;
    return error;
  }

  const auto& response = *result.response;
  if (response.status >= 200 && response.status < 300) {
    return std::nullopt;
  }

  FetchError error;
  error.http_status = static_cast<int>(response.status);

  if (response.status == 403 && response.body.find(kCaptchaMarker) != std::string::npos) {
    error.category = v1::ERROR_CATEGORY_CAPTCHA;
    error.message  = "Captcha challenge on status 403";
  } else if (IsKnownStatus(response.status, response.body)) {
    error.category = v1::ERROR_CATEGORY_KNOWN_HTTP_STATUS;
    error.message  = "Known bad response on status " + std::to_string(response.status);
  } else {
    error.category = v1::ERROR_CATEGORY_HTTP_STATUS;
    error.message  = "Failed to fetch, status " + std::to_string(response.status);
    error.body     = response.body;
  }
  return error;
}

FetchOutcome Fetch(HttpClient& client, const HttpRequest& request) {
  auto result = client.Get(request);
  if (auto error = ClassifyResult(result)) {
    return *error;
  }
  return std::move(*result.response);
}

std::string CategoryName(v1::ErrorCategory category) {
  switch (category) {
    case v1::ERROR_CATEGORY_TRANSIENT_NETWORK:
      return "transient_network";
    case v1::ERROR_CATEGORY_HTTP_STATUS:
      return "http_status";
    case v1::ERROR_CATEGORY_KNOWN_HTTP_STATUS:
      return "known_http_status";
    case v1::ERROR_CATEGORY_CAPTCHA:
      return "captcha";
    case v1::ERROR_CATEGORY_CONTENT_MISMATCH:
      return "content_mismatch";
    case v1::ERROR_CATEGORY_PARSE:
      return "parse";
    case v1::ERROR_CATEGORY_DEADLINE:
      return "deadline";
    case v1::ERROR_CATEGORY_INTERNAL:
      return "internal";
    default:
      return "unspecified";
  }
}

} // namespace mirrorwatch::http
