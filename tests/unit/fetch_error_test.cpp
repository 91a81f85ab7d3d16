#include "internal/http/fetch_error.hpp"

#include <cassert>
#include <iostream>

#include "support/fake_http_client.hpp"

namespace {

using namespace mirrorwatch;
using mirrorwatch::testing::NetworkError;
using mirrorwatch::testing::Respond;

void TestSuccessIsNotAnError() {
  assert(!http::ClassifyResult(Respond(200, "ok")));
  assert(!http::ClassifyResult(Respond(204, "")));
}

void TestTransportFailures() {
  auto refused = http::ClassifyResult(NetworkError("connection refused"));
  assert(refused);
  assert(refused->category == v1::ERROR_CATEGORY_TRANSIENT_NETWORK);
  assert(refused->message == "connection refused");
  assert(!refused->http_status);

  auto timeout = http::ClassifyResult(NetworkError("", true));
  assert(timeout);
  assert(timeout->category == v1::ERROR_CATEGORY_DEADLINE);
  assert(timeout->message == "request failed");
}

void TestCaptcha() {
  auto error = http::ClassifyResult(Respond(403, "<p>Enable JavaScript and cookies to continue</p>"));
  assert(error);
  assert(error->category == v1::ERROR_CATEGORY_CAPTCHA);
  assert(error->message == "Captcha challenge on status 403");
  assert(error->http_status == 403);
}

void TestKnownStatusesDropBody() {
  for (unsigned status : {404u, 502u, 503u, 504u, 520u, 527u}) {
    auto error = http::ClassifyResult(Respond(status, "gateway page"));
    assert(error);
    assert(error->category == v1::ERROR_CATEGORY_KNOWN_HTTP_STATUS);
    assert(error->message == "Known bad response on status " + std::to_string(status));
    assert(error->body.empty());
  }

  auto blocked = http::ClassifyResult(Respond(403, "You have been blocked"));
  assert(blocked->category == v1::ERROR_CATEGORY_KNOWN_HTTP_STATUS);

  auto limited = http::ClassifyResult(Respond(429, "Instance has been rate limited."));
  assert(limited->category == v1::ERROR_CATEGORY_KNOWN_HTTP_STATUS);
}

void TestUnexpectedStatusKeepsBody() {
  auto forbidden = http::ClassifyResult(Respond(403, "nope"));
  assert(forbidden->category == v1::ERROR_CATEGORY_HTTP_STATUS);
  assert(forbidden->message == "Failed to fetch, status 403");
  assert(forbidden->body == "nope");

  auto limited = http::ClassifyResult(Respond(429, "slow down"));
  assert(limited->category == v1::ERROR_CATEGORY_HTTP_STATUS);

  auto server = http::ClassifyResult(Respond(500, "trace"));
  assert(server->category == v1::ERROR_CATEGORY_HTTP_STATUS);
  assert(server->body == "trace");
}

void TestFetchUsesClient() {
  testing::FakeHttpClient client;
  client.Route("https://a.example/ok", Respond(200, "body"));

  http::HttpRequest ok;
  ok.url       = "https://a.example/ok";
  auto outcome = http::Fetch(client, ok);
  assert(std::holds_alternative<http::HttpResponse>(outcome));
  assert(std::get<http::HttpResponse>(outcome).body == "body");

  http::HttpRequest missing;
  missing.url = "https://a.example/missing";
  auto failed = http::Fetch(client, missing);
  assert(std::holds_alternative<http::FetchError>(failed));
  assert(std::get<http::FetchError>(failed).category == v1::ERROR_CATEGORY_TRANSIENT_NETWORK);
}

void TestCategoryNames() {
  assert(http::CategoryName(v1::ERROR_CATEGORY_KNOWN_HTTP_STATUS) == "known_http_status");
  assert(http::CategoryName(v1::ERROR_CATEGORY_DEADLINE) == "deadline");
  assert(http::CategoryName(v1::ERROR_CATEGORY_UNSPECIFIED) == "unspecified");
}

} // namespace

int main() {
  TestSuccessIsNotAnError();
  TestTransportFailures();
  TestCaptcha();
  TestKnownStatusesDropBody();
  TestUnexpectedStatusKeepsBody();
  TestFetchUsesClient();
  TestCategoryNames();

  std::cout << "fetch_error_test: pass\n";
  return 0;
}
