#include "url.hpp"

#include "internal/util/strings.hpp"

namespace mirrorwatch::http {

std::string Url::ToString() const {
  const bool default_port = (scheme == "https" && port == "443") || (scheme == "http" && port == "80");
  return scheme + "://" + host + (default_port ? "" : ":" + port) + target;
}

std::optional<Url> ParseUrl(const std::string& text) {
  const auto trimmed = util::Trim(text);
  const auto sep     = trimmed.find("://");
  if (sep == std::string::npos) return std::nullopt;

  Url url;
  url.scheme = util::ToLower(trimmed.substr(0, sep));
  if (url.scheme != "http" && url.scheme != "https") return std::nullopt;

  auto rest       = trimmed.substr(sep + 3);
  auto target_pos = rest.find_first_of("/?#");
  auto authority  = rest.substr(0, target_pos);
  url.target      = target_pos == std::string::npos ? "/" : rest.substr(target_pos);
  if (url.target.front() != '/') url.target = "/" + url.target;
  if (auto hash = url.target.find('#'); hash != std::string::npos) url.target.erase(hash);

  if (auto at = authority.rfind('@'); at != std::string::npos) authority = authority.substr(at + 1);

  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos) return std::nullopt;
    url.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size() && authority[close + 1] == ':') url.port = authority.substr(close + 2);
  } else if (auto colon = authority.rfind(':'); colon != std::string::npos) {
    url.host = authority.substr(0, colon);
    url.port = authority.substr(colon + 1);
  } else {
    url.host = authority;
  }

  url.host = util::ToLower(url.host);
  if (url.host.empty()) return std::nullopt;
  if (url.port.empty()) url.port = url.scheme == "https" ? "443" : "80";
  return url;
}

std::string NormalizeHost(const std::string& text) {
  auto host = util::ToLower(util::Trim(text));
  if (auto sep = host.find("://"); sep != std::string::npos) host = host.substr(sep + 3);
  if (auto end = host.find_first_of("/?#"); end != std::string::npos) host = host.substr(0, end);
  if (auto at = host.rfind('@'); at != std::string::npos) host = host.substr(at + 1);
  if (auto colon = host.rfind(':'); colon != std::string::npos && host.find(']') == std::string::npos) host = host.substr(0, colon);
  while (!host.empty() && host.back() == '.') host.pop_back();
  if (host.find_first_of(" \t<>\"'") != std::string::npos) return {};
  return host;
}

std::string BaseUrlFor(const std::string& domain, const std::string& listed) {
  const bool plain_http = util::IStartsWith(util::Trim(listed), "http://");
  std::string base      = (plain_http ? "http://" : "https://") + domain;
  if (auto url = ParseUrl(listed); url && url->host == domain) {
    const bool default_port = (url->scheme == "https" && url->port == "443") || (url->scheme == "http" && url->port == "80");
    if (!default_port) base += ":" + url->port;
  }
  return base;
}

std::string JoinUrl(const std::string& base, const std::string& path) {
  std::string out = base;
  while (!out.empty() && out.back() == '/') out.pop_back();
  if (path.empty() || path.front() != '/') out.push_back('/');
  return out + path;
}

std::string ResolveLocation(const Url& from, const std::string& location) {
  if (location.find("://") != std::string::npos) return location;
  if (util::StartsWith(location, "//")) return from.scheme + ":" + location;

  Url next = from;
  if (!location.empty() && location.front() == '/') {
    next.target = location;
  } else {
    auto dir    = from.target.substr(0, from.target.find('?'));
    dir         = dir.substr(0, dir.rfind('/') + 1);
    next.target = dir + location;
  }
  return next.ToString();
}

} // namespace mirrorwatch::http
