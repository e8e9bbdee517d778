#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <json-filter/path/node.hpp>
#include <json-filter/error.hpp>

namespace path {

// Splits on commas that are not nested inside parentheses. Every token is
// trimmed, and the remainder after the last top-level comma is always
// emitted, so an empty input yields a single empty token.
std::vector<std::string_view> split_by_top_level_commas(std::string_view input);

// Parses path expressions such as `a,b(c,d(e))` into a merged Node tree
// rooted at a `ROOT` node.
class Parser {
public:
  // std::nullopt means no expression at all and yields a terminal root.
  Node parse(const std::optional<std::string> &input) const;
private:
  NodeList parse_segments(std::string_view input) const;
  Node parse_segment(std::string_view token) const;

  ParseError make_invalid_segment_error(std::string_view token) const;
};

} // namespace path
