#include "git_refs.hpp"

#include <cctype>

namespace mirrorwatch::upstream {

namespace {

std::optional<std::size_t> ParseLength(std::string_view hex) {
  std::size_t value = 0;
  for (char c : hex) {
    value <<= 4;
    if (c >= '0' && c <= '9') {
      value |= static_cast<std::size_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      value |= static_cast<std::size_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      value |= static_cast<std::size_t>(c - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return value;
}

bool IsCommitId(std::string_view id) {
  if (id.size() != 40 && id.size() != 64) return false;
  for (char c : id) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

} // namespace

std::string InfoRefsUrl(const std::string& git_url) {
  std::string base = git_url;
  while (!base.empty() && base.back() == '/') base.pop_back();
  return base + "/info/refs?service=git-upload-pack";
}

std::optional<std::string> FindBranchHead(std::string_view advertisement, std::string_view branch) {
  const std::string wanted = "refs/heads/" + std::string(branch);

  std::size_t pos = 0;
  while (pos + 4 <= advertisement.size()) {
    auto length = ParseLength(advertisement.substr(pos, 4));
    if (!length) return std::nullopt;

    // flush-pkt
    if (*length == 0) {
      pos += 4;
      continue;
    }
    if (*length < 4 || pos + *length > advertisement.size()) return std::nullopt;

    auto line = advertisement.substr(pos + 4, *length - 4);
    pos += *length;

    if (!line.empty() && line.back() == '\n') line.remove_suffix(1);
    if (auto nul = line.find('\0'); nul != std::string_view::npos) line = line.substr(0, nul);
    if (line.empty() || line.front() == '#') continue;

    auto space = line.find(' ');
    if (space == std::string_view::npos) continue;

    auto id  = line.substr(0, space);
    auto ref = line.substr(space + 1);
    if (ref == wanted && IsCommitId(id)) {
      return std::string(id);
    }
  }
  return std::nullopt;
}

} // namespace mirrorwatch::upstream
