#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mirrorwatch::util::html {

/*
  Tolerant element scanner for server-rendered pages.

  Not a DOM: elements are located by tag name and attributes on the raw
  markup, and an element's content runs to its matching close tag (or the
  end of the enclosing range when the page never closes it). Comments,
  scripts and styles are skipped.
*/

struct Element {
  std::string      name;       // lowercase tag name
  std::string_view attributes; // raw text between the name and '>'
  std::string_view inner;      // content between open and close tag
  std::size_t      begin = 0;  // offset of '<' of the open tag
  std::size_t      end   = 0;  // offset just past the close tag
};

// Attribute value, entity-decoded; nullopt when absent.
std::optional<std::string> Attribute(const Element& element, std::string_view name);

bool HasClass(const Element& element, std::string_view cls);

// All elements named `tag` inside `scope`, in document order, nested ones included.
std::vector<Element> FindAll(std::string_view scope, std::string_view tag);

// All elements of any tag carrying class `cls`.
std::vector<Element> FindAllByClass(std::string_view scope, std::string_view cls);

std::optional<Element> FindFirst(std::string_view scope, std::string_view tag);

std::optional<Element> FindById(std::string_view scope, std::string_view id);

// Concatenated text content, entity-decoded, whitespace kept as-is.
std::string Text(std::string_view markup);

std::string DecodeEntities(std::string_view text);

} // namespace mirrorwatch::util::html
