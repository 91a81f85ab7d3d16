#include "instance_list_parser.hpp"

#include "internal/http/url.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/html.hpp"
#include "internal/util/strings.hpp"

namespace mirrorwatch::registry {

namespace html = util::html;

namespace {

constexpr std::string_view kCheckbox = "\xE2\x9C\x85"; // U+2705

std::optional<ListedInstance> ParseRow(const html::Element& row) {
  auto cells = html::FindAll(row.inner, "td");
  if (cells.empty()) {
    return std::nullopt;
  }

  auto link = html::FindFirst(cells.front().inner, "a");
  auto href = link ? html::Attribute(*link, "href") : std::nullopt;
  if (!href) {
    MIRRORWATCH_LOG_ERROR("instance row without link, skipping", {observability::StringField("row", util::TruncateUtf8(row.inner, 200))});
    return std::nullopt;
  }

  std::string url(util::Trim(*href));
  while (!url.empty() && url.back() == '/') url.pop_back();

  const auto domain = http::NormalizeHost(url);
  if (domain.empty() || url.find("://") == std::string::npos) {
    MIRRORWATCH_LOG_ERROR("instance row with invalid url, skipping", {observability::StringField("url", url)});
    return std::nullopt;
  }

  if (cells.size() < 5) {
    MIRRORWATCH_LOG_ERROR("instance row missing fields, skipping", {observability::StringField("domain", domain)});
    return std::nullopt;
  }

  ListedInstance instance;
  instance.domain       = domain;
  instance.url          = url;
  instance.online       = util::Trim(html::Text(cells[1].inner)) == kCheckbox;
  instance.country      = std::string(util::Trim(html::Text(cells[3].inner)));
  instance.ssl_provider = std::string(util::Trim(html::Text(cells[4].inner)));
  return instance;
}

} // namespace

std::variant<ListedInstances, ListParseError> ParseInstanceList(std::string_view page) {
  auto wiki = html::FindById(page, "wiki-body");
  if (!wiki) {
    return ListParseError{"no #wiki-body element found"};
  }

  std::optional<html::Element> table;
  for (auto& candidate : html::FindAll(wiki->inner, "table")) {
    if (html::Text(candidate.inner).find("Online") != std::string::npos) {
      table = std::move(candidate);
      break;
    }
  }
  if (!table) {
    return ListParseError{"no instance table found"};
  }

  // Header rows live in <thead> or use <th>; only rows with <td> are data.
  std::string_view rows_scope = table->inner;
  if (auto body = html::FindFirst(table->inner, "tbody")) {
    rows_scope = body->inner;
  }

  ListedInstances instances;
  for (const auto& row : html::FindAll(rows_scope, "tr")) {
    auto instance = ParseRow(row);
    if (!instance) continue;

    auto domain = instance->domain;
    if (!instances.emplace(domain, *instance).second) {
      MIRRORWATCH_LOG_WARN("duplicate instance domain in listing", {observability::StringField("domain", domain)});
      instances[domain] = std::move(*instance);
    }
  }
  return instances;
}

} // namespace mirrorwatch::registry
