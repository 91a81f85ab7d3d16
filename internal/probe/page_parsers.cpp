#include "page_parsers.hpp"

#include <regex>

#include "internal/util/html.hpp"
#include "internal/util/strings.hpp"

namespace mirrorwatch::probe {

namespace html = util::html;

namespace {

const std::regex& VersionPattern() {
  static const std::regex pattern(R"(^((\d+\.\d+\.\d+)|[a-zA-Z0-9]{7,}))", std::regex::icase);
  return pattern;
}

std::string LastPathSegment(const std::string& url) {
  auto path = url.substr(0, url.find_first_of("?#"));
  while (!path.empty() && path.back() == '/') path.pop_back();
  return path.substr(path.rfind('/') + 1);
}

} // namespace

std::variant<ProfileParsed, ParseFailure> ParseProfile(std::string_view page) {
  auto cards = html::FindAllByClass(page, "profile-card-username");
  if (cards.empty()) {
    return ParseFailure{"no profile card found"};
  }

  auto timelines = html::FindAllByClass(page, "timeline");
  if (timelines.empty()) {
    return ParseFailure{"no timeline found"};
  }

  ProfileParsed parsed;
  parsed.name       = std::string(util::Trim(html::Text(cards.front().inner)));
  parsed.post_count = html::FindAllByClass(timelines.front().inner, "timeline-item").size();
  return parsed;
}

std::variant<AboutParsed, ParseFailure> ParseAbout(std::string_view page) {
  for (const auto& paragraph : html::FindAll(page, "p")) {
    if (html::Text(paragraph.inner).find("Version") == std::string::npos) continue;

    auto link = html::FindFirst(paragraph.inner, "a");
    if (!link) {
      return ParseFailure{"version paragraph without link"};
    }
    auto href = html::Attribute(*link, "href");
    if (!href) {
      return ParseFailure{"version link without href"};
    }

    AboutParsed about;
    about.version = std::string(util::Trim(html::Text(link->inner)));
    about.url     = std::string(util::Trim(*href));
    if (!std::regex_search(about.version, VersionPattern())) {
      return ParseFailure{"unexpected version format '" + about.version + "'"};
    }
    about.commit = LastPathSegment(about.url);
    return about;
  }
  return ParseFailure{"no version paragraph found"};
}

} // namespace mirrorwatch::probe
