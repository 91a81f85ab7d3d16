#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace mirrorwatch::probe {

struct ParseFailure {
  std::string message;
};

struct ProfileParsed {
  std::string name;       // text of .profile-card-username
  std::size_t post_count = 0; // .timeline-item elements inside the first .timeline
};

struct AboutParsed {
  std::string version; // link text
  std::string url;     // link target
  std::string commit;  // last path segment of url
};

std::variant<ProfileParsed, ParseFailure> ParseProfile(std::string_view html);

// First <p> mentioning "Version"; its first link must read like a release
// (x.y.z) or a commit id.
std::variant<AboutParsed, ParseFailure> ParseAbout(std::string_view html);

} // namespace mirrorwatch::probe
