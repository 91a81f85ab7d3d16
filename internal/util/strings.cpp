#include "strings.hpp"

#include <algorithm>
#include <cctype>

namespace mirrorwatch::util {

std::string ToLower(std::string_view in) {
  std::string out(in);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string_view Trim(std::string_view in) {
  while (!in.empty() && std::isspace(static_cast<unsigned char>(in.front()))) in.remove_prefix(1);
  while (!in.empty() && std::isspace(static_cast<unsigned char>(in.back()))) in.remove_suffix(1);
  return in;
}

bool StartsWith(std::string_view in, std::string_view prefix) {
  return in.substr(0, prefix.size()) == prefix;
}

bool IStartsWith(std::string_view in, std::string_view prefix) {
  if (in.size() < prefix.size()) return false;
  return ToLower(in.substr(0, prefix.size())) == ToLower(prefix);
}

bool IContains(std::string_view haystack, std::string_view needle) {
  return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

std::string TruncateUtf8(std::string_view in, std::size_t max_bytes) {
  if (in.size() <= max_bytes) {
    return std::string(in);
  }
  std::size_t cut = max_bytes;
  // step back over continuation bytes (10xxxxxx)
  while (cut > 0 && (static_cast<unsigned char>(in[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return std::string(in.substr(0, cut));
}

std::string ReplaceAll(std::string in, std::string_view token, std::string_view value) {
  if (token.empty()) return in;
  std::size_t pos = 0;
  while ((pos = in.find(token, pos)) != std::string::npos) {
    in.replace(pos, token.size(), value);
    pos += value.size();
  }
  return in;
}

} // namespace mirrorwatch::util
