#pragma once

#include <string>
#include <string_view>

namespace mirrorwatch::util {

std::string ToLower(std::string_view in);
std::string_view Trim(std::string_view in);

bool StartsWith(std::string_view in, std::string_view prefix);
bool IStartsWith(std::string_view in, std::string_view prefix);
bool IContains(std::string_view haystack, std::string_view needle);

// Cuts `in` to at most `max_bytes` without splitting a UTF-8 sequence.
std::string TruncateUtf8(std::string_view in, std::size_t max_bytes);

// Replaces every occurrence of `token` in `in`.
std::string ReplaceAll(std::string in, std::string_view token, std::string_view value);

} // namespace mirrorwatch::util
