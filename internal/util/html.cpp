#include "html.hpp"

#include <cctype>

#include "strings.hpp"

namespace mirrorwatch::util::html {

namespace {

struct Tag {
  std::string      name;
  std::string_view attributes;
  std::size_t      begin = 0;
  std::size_t      end   = 0; // past '>'
  bool             closing      = false;
  bool             self_closing = false;
};

bool IsVoid(std::string_view name) {
  static constexpr std::string_view kVoid[] = {"area", "base", "br", "col", "embed", "hr", "img", "input", "link", "meta", "source", "track", "wbr"};
  for (auto v : kVoid) {
    if (v == name) return true;
  }
  return false;
}

bool IsNameChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == ':';
}

// Finds the '>' closing a tag, ignoring quoted attribute values.
std::size_t FindTagEnd(std::string_view in, std::size_t pos) {
  char quote = 0;
  for (; pos < in.size(); ++pos) {
    const char c = in[pos];
    if (quote) {
      if (c == quote) quote = 0;
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '>') {
      return pos;
    }
  }
  return std::string_view::npos;
}

std::optional<Tag> NextTag(std::string_view in, std::size_t pos) {
  while (true) {
    pos = in.find('<', pos);
    if (pos == std::string_view::npos || pos + 1 >= in.size()) return std::nullopt;

    if (in.compare(pos, 4, "<!--") == 0) {
      auto close = in.find("-->", pos + 4);
      if (close == std::string_view::npos) return std::nullopt;
      pos = close + 3;
      continue;
    }
    if (in[pos + 1] == '!' || in[pos + 1] == '?') {
      auto close = in.find('>', pos);
      if (close == std::string_view::npos) return std::nullopt;
      pos = close + 1;
      continue;
    }

    Tag         tag;
    std::size_t cursor = pos + 1;
    if (in[cursor] == '/') {
      tag.closing = true;
      ++cursor;
    }
    const std::size_t name_begin = cursor;
    while (cursor < in.size() && IsNameChar(in[cursor])) ++cursor;
    if (cursor == name_begin) {
      pos += 1;
      continue;
    }

    auto close = FindTagEnd(in, cursor);
    if (close == std::string_view::npos) return std::nullopt;

    tag.name       = ToLower(in.substr(name_begin, cursor - name_begin));
    tag.attributes = in.substr(cursor, close - cursor);
    tag.begin      = pos;
    tag.end        = close + 1;

    auto trimmed     = Trim(tag.attributes);
    tag.self_closing = !trimmed.empty() && trimmed.back() == '/';
    return tag;
  }
}

// Skips raw-text content of script/style elements.
std::size_t SkipRawText(std::string_view in, const Tag& tag) {
  if (tag.closing || (tag.name != "script" && tag.name != "style")) return tag.end;
  auto lower = ToLower(in.substr(tag.end));
  auto close = lower.find("</" + tag.name);
  return close == std::string::npos ? in.size() : tag.end + close;
}

Element Complete(std::string_view in, const Tag& open) {
  Element element;
  element.name       = open.name;
  element.attributes = open.attributes;
  element.begin      = open.begin;

  if (open.self_closing || IsVoid(open.name)) {
    element.inner = in.substr(open.end, 0);
    element.end   = open.end;
    return element;
  }

  int         depth = 1;
  std::size_t pos   = SkipRawText(in, open);
  while (auto tag = NextTag(in, pos)) {
    pos = SkipRawText(in, *tag);
    if (tag->name != open.name || tag->self_closing) continue;
    depth += tag->closing ? -1 : 1;
    if (depth == 0) {
      element.inner = in.substr(open.end, tag->begin - open.end);
      element.end   = tag->end;
      return element;
    }
  }

  element.inner = in.substr(open.end);
  element.end   = in.size();
  return element;
}

template <typename Match>
std::vector<Element> Collect(std::string_view scope, Match&& match, bool first_only) {
  std::vector<Element> out;
  std::size_t          pos = 0;
  while (auto tag = NextTag(scope, pos)) {
    pos = SkipRawText(scope, *tag);
    if (tag->closing) continue;
    if (match(*tag)) {
      out.push_back(Complete(scope, *tag));
      if (first_only) break;
    }
  }
  return out;
}

std::optional<std::string> AttributeOf(std::string_view attributes, std::string_view name) {
  std::size_t pos = 0;
  while (pos < attributes.size()) {
    while (pos < attributes.size() && (std::isspace(static_cast<unsigned char>(attributes[pos])) || attributes[pos] == '/')) ++pos;
    const std::size_t key_begin = pos;
    while (pos < attributes.size() && !std::isspace(static_cast<unsigned char>(attributes[pos])) && attributes[pos] != '=' && attributes[pos] != '/') {
      ++pos;
    }
    if (pos == key_begin) break;
    const auto key = ToLower(attributes.substr(key_begin, pos - key_begin));

    while (pos < attributes.size() && std::isspace(static_cast<unsigned char>(attributes[pos]))) ++pos;
    std::string_view value;
    if (pos < attributes.size() && attributes[pos] == '=') {
      ++pos;
      while (pos < attributes.size() && std::isspace(static_cast<unsigned char>(attributes[pos]))) ++pos;
      if (pos < attributes.size() && (attributes[pos] == '"' || attributes[pos] == '\'')) {
        const char quote = attributes[pos++];
        auto       close = attributes.find(quote, pos);
        if (close == std::string_view::npos) close = attributes.size();
        value = attributes.substr(pos, close - pos);
        pos   = close + 1;
      } else {
        const std::size_t value_begin = pos;
        while (pos < attributes.size() && !std::isspace(static_cast<unsigned char>(attributes[pos]))) ++pos;
        value = attributes.substr(value_begin, pos - value_begin);
      }
    }
    if (key == ToLower(name)) return DecodeEntities(value);
  }
  return std::nullopt;
}

bool ClassListContains(std::string_view attributes, std::string_view cls) {
  auto classes = AttributeOf(attributes, "class");
  if (!classes) return false;

  std::size_t pos = 0;
  while (pos < classes->size()) {
    while (pos < classes->size() && std::isspace(static_cast<unsigned char>((*classes)[pos]))) ++pos;
    const std::size_t begin = pos;
    while (pos < classes->size() && !std::isspace(static_cast<unsigned char>((*classes)[pos]))) ++pos;
    if (std::string_view(*classes).substr(begin, pos - begin) == cls) return true;
  }
  return false;
}

} // namespace

std::optional<std::string> Attribute(const Element& element, std::string_view name) {
  return AttributeOf(element.attributes, name);
}

bool HasClass(const Element& element, std::string_view cls) {
  return ClassListContains(element.attributes, cls);
}

std::vector<Element> FindAll(std::string_view scope, std::string_view tag) {
  const auto wanted = ToLower(tag);
  return Collect(scope, [&](const Tag& t) { return t.name == wanted; }, false);
}

std::vector<Element> FindAllByClass(std::string_view scope, std::string_view cls) {
  return Collect(scope, [&](const Tag& t) { return ClassListContains(t.attributes, cls); }, false);
}

std::optional<Element> FindFirst(std::string_view scope, std::string_view tag) {
  const auto wanted = ToLower(tag);
  auto       found  = Collect(scope, [&](const Tag& t) { return t.name == wanted; }, true);
  if (found.empty()) return std::nullopt;
  return found.front();
}

std::optional<Element> FindById(std::string_view scope, std::string_view id) {
  auto found = Collect(
      scope,
      [&](const Tag& t) {
        auto value = AttributeOf(t.attributes, "id");
        return value && *value == id;
      },
      true);
  if (found.empty()) return std::nullopt;
  return found.front();
}

std::string Text(std::string_view markup) {
  std::string out;
  std::size_t pos = 0;
  while (pos < markup.size()) {
    auto tag = NextTag(markup, pos);
    if (!tag) {
      out += markup.substr(pos);
      break;
    }
    out += markup.substr(pos, tag->begin - pos);
    pos = SkipRawText(markup, *tag);
    if (pos != tag->end) {
      // skip the raw text and its close tag
      auto close = NextTag(markup, pos);
      pos        = close ? close->end : markup.size();
    }
  }
  return DecodeEntities(out);
}

std::string DecodeEntities(std::string_view text) {
  struct Entity {
    std::string_view name;
    std::string_view value;
  };
  static constexpr Entity kEntities[] = {{"&amp;", "&"}, {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&#39;", "'"}, {"&apos;", "'"}, {"&nbsp;", " "}};

  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (text[pos] != '&') {
      out.push_back(text[pos++]);
      continue;
    }
    bool matched = false;
    for (const auto& entity : kEntities) {
      if (text.compare(pos, entity.name.size(), entity.name) == 0) {
        out += entity.value;
        pos += entity.name.size();
        matched = true;
        break;
      }
    }
    if (!matched) out.push_back(text[pos++]);
  }
  return out;
}

} // namespace mirrorwatch::util::html
