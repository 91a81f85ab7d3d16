#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mirrorwatch::upstream {

// "<git_url>/info/refs?service=git-upload-pack"
std::string InfoRefsUrl(const std::string& git_url);

/*
  Reads a smart-HTTP ref advertisement (git pkt-line framing) and returns
  the commit of refs/heads/<branch>.

  nullopt when the framing is broken or the branch is not advertised.
*/
std::optional<std::string> FindBranchHead(std::string_view advertisement, std::string_view branch);

} // namespace mirrorwatch::upstream
