#pragma once

#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace mirrorwatch::registry {

struct ListedInstance {
  std::string domain;
  std::string url;
  bool        online = false;
  std::string country;
  std::string ssl_provider;
};

struct ListParseError {
  std::string message;
};

// Keyed by normalized domain.
using ListedInstances = std::map<std::string, ListedInstance>;

/*
  Parses the public instance wiki page.

  The listing is the first table inside #wiki-body whose text contains
  "Online"; each body row holds the instance link followed by the online
  marker, a free-form column, the country and the SSL provider. Malformed
  rows are skipped and logged, later duplicates replace earlier ones.
*/
std::variant<ListedInstances, ListParseError> ParseInstanceList(std::string_view html);

} // namespace mirrorwatch::registry
