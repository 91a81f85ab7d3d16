#pragma once

#include <optional>
#include <string>

namespace mirrorwatch::http {

struct Url {
  std::string scheme; // "http" or "https"
  std::string host;
  std::string port;
  std::string target; // path + query, never empty

  std::string ToString() const;
};

std::optional<Url> ParseUrl(const std::string& text);

// Host of a listing entry or configured host: lowercase, no scheme, path,
// query, port or trailing dot. Empty when nothing usable remains.
std::string NormalizeHost(const std::string& text);

// Base URL of an instance: https unless `listed` spells out http://. A
// non-default port in `listed` is kept; the domain itself never carries one.
std::string BaseUrlFor(const std::string& domain, const std::string& listed = {});

// Joins a base URL and an absolute path, which may carry a query.
std::string JoinUrl(const std::string& base, const std::string& path);

// Resolves a Location header against the URL that produced it.
std::string ResolveLocation(const Url& from, const std::string& location);

} // namespace mirrorwatch::http
