#include "internal/http/url.hpp"

#include <cassert>
#include <iostream>

namespace {

using namespace mirrorwatch::http;

void TestParseUrlDefaults() {
  auto url = ParseUrl("https://Nitter.Example/jack?x=1#frag");
  assert(url);
  assert(url->scheme == "https");
  assert(url->host == "nitter.example");
  assert(url->port == "443");
  assert(url->target == "/jack?x=1");
  assert(url->ToString() == "https://nitter.example/jack?x=1");
}

void TestParseUrlPortsAndIpv6() {
  auto url = ParseUrl("http://user@host.example:8080");
  assert(url);
  assert(url->host == "host.example");
  assert(url->port == "8080");
  assert(url->target == "/");
  assert(url->ToString() == "http://host.example:8080/");

  auto v6 = ParseUrl("https://[2001:db8::1]:8443/about");
  assert(v6);
  assert(v6->host == "2001:db8::1");
  assert(v6->port == "8443");
}

void TestParseUrlRejects() {
  assert(!ParseUrl("ftp://example.org/"));
  assert(!ParseUrl("example.org/path"));
  assert(!ParseUrl("https:///nohost"));
  assert(!ParseUrl("https://[::1/broken"));
}

void TestNormalizeHost() {
  assert(NormalizeHost("  HTTPS://Nitter.Example:443/path?q=1 ") == "nitter.example");
  assert(NormalizeHost("nitter.example.") == "nitter.example");
  assert(NormalizeHost("nitter.example/") == "nitter.example");
  assert(NormalizeHost("https://user@mirror.example") == "mirror.example");
  assert(NormalizeHost("bad host").empty());
  assert(NormalizeHost("").empty());
}

void TestBaseUrlFor() {
  assert(BaseUrlFor("nitter.example") == "https://nitter.example");
  assert(BaseUrlFor("nitter.example", "https://nitter.example/") == "https://nitter.example");
  assert(BaseUrlFor("onion.example", "HTTP://onion.example") == "http://onion.example");
  assert(BaseUrlFor("nitter.example", "https://nitter.example:8443/") == "https://nitter.example:8443");
  assert(BaseUrlFor("nitter.example", "http://nitter.example:80") == "http://nitter.example");
  assert(BaseUrlFor("nitter.example", "https://nitter.example:443") == "https://nitter.example");
  assert(NormalizeHost("https://nitter.example:8443") == "nitter.example");
}

void TestJoinUrl() {
  assert(JoinUrl("https://a.example/", "/jack") == "https://a.example/jack");
  assert(JoinUrl("https://a.example", "jack/rss") == "https://a.example/jack/rss");
  assert(JoinUrl("https://a.example", "/.health?key=1") == "https://a.example/.health?key=1");
}

void TestResolveLocation() {
  auto from = *ParseUrl("https://a.example/dir/page?x=1");
  assert(ResolveLocation(from, "https://b.example/") == "https://b.example/");
  assert(ResolveLocation(from, "//c.example/x") == "https://c.example/x");
  assert(ResolveLocation(from, "/root") == "https://a.example/root");
  assert(ResolveLocation(from, "other") == "https://a.example/dir/other");
}

} // namespace

int main() {
  TestParseUrlDefaults();
  TestParseUrlPortsAndIpv6();
  TestParseUrlRejects();
  TestNormalizeHost();
  TestBaseUrlFor();
  TestJoinUrl();
  TestResolveLocation();

  std::cout << "url_test: pass\n";
  return 0;
}
