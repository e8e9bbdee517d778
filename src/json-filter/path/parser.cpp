#include <algorithm>
#include <format>
#include <utility>

#include <json-filter/path/merger.hpp>
#include <json-filter/util/strings.hpp>
#include <json-filter/error.hpp>

#include <json-filter/path/parser.hpp>

namespace path {

// [A-Za-z0-9_] or whitespace.
static bool is_key_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
    || c == '_' || util::is_space(c);
}

static bool is_nested_char(char c) {
  return is_key_char(c) || c == ',' || c == '(' || c == ')';
}

std::vector<std::string_view> split_by_top_level_commas(std::string_view input) {
  std::vector<std::string_view> tokens;

  int depth = 0;
  size_t token_start = 0;

  for (size_t i = 0; i < input.size(); i++) {
    switch (input[i]) {
      case '(': depth++; break;
      case ')': depth--; break;
      case ',': {
        if (depth == 0) {
          tokens.push_back(util::trim(input.substr(token_start, i - token_start)));
          token_start = i + 1;
        }
        break;
      }
      default: break;
    }
  }

  tokens.push_back(util::trim(input.substr(token_start)));

  return tokens;
}

Node Parser::parse(const std::optional<std::string> &input) const {
  if (!input.has_value()) {
    return Node(Node::ROOT_KEY);
  }

  auto root = Node(Node::ROOT_KEY, parse_segments(input.value()));

  return Merger().merge(root);
}

NodeList Parser::parse_segments(std::string_view input) const {
  NodeList nodes;

  for (auto token : split_by_top_level_commas(input)) {
    // `a()` and `a,,b` carry empty tokens that contribute nothing.
    if (token.empty()) continue;
    nodes.push_back(parse_segment(token));
  }

  return nodes;
}

// A segment is a key, optionally followed by a parenthesized list that
// runs to the end of the token. The list is parsed recursively, so only the
// nesting depth of the expression adds stack frames.
Node Parser::parse_segment(std::string_view token) const {
  size_t key_end = 0;
  while (key_end < token.size() && is_key_char(token[key_end])) key_end++;

  auto key = std::string(util::trim(token.substr(0, key_end)));
  auto rest = token.substr(key_end);

  if (rest.empty()) {
    return Node(std::move(key));
  }

  if (rest.size() < 2 || rest.front() != '(' || rest.back() != ')') {
    throw make_invalid_segment_error(token);
  }

  auto nested = rest.substr(1, rest.size() - 2);
  if (!std::all_of(nested.begin(), nested.end(), is_nested_char)) {
    throw make_invalid_segment_error(token);
  }

  return Node(std::move(key), parse_segments(nested));
}

ParseError Parser::make_invalid_segment_error(std::string_view token) const {
  return ParseError(std::format("The node format is invalid: '{}'", token));
}

} // namespace path
