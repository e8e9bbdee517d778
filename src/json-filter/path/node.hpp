#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace path {

class Node;

// Children of a segment written without parentheses, e.g. `a` in `a,b(c)`.
struct Terminal {};

using NodeList = std::vector<Node>;

// A node either has no stated sub-paths (Terminal) or an explicit, possibly
// empty, list of them. `a` and `a()` must never compare equal.
using Children = std::variant<Terminal, NodeList>;

// One segment of a parsed path expression.
class Node {
public:
  static constexpr const char *ROOT_KEY = "ROOT";

  Node(std::string key, Children children);
  explicit Node(std::string key);

  const std::string &get_key() const { return key; }
  const Children &get_children() const { return children; }

  bool is_terminal() const;

  // Throws std::logic_error for a terminal node.
  const NodeList &get_sub_nodes() const;

  // Renders the node back into path-expression syntax: `a` or `a(b,c(d))`.
  std::string to_string() const;

  std::size_t hash() const;

  bool operator==(const Node &other) const;
  bool operator!=(const Node &other) const { return !(*this == other); }
private:
  std::string key;
  Children children;

  void write_to(std::string &out) const;
};

std::ostream &operator<<(std::ostream &os, const Node &node);

} // namespace path

namespace std {

template <>
struct hash<path::Node> {
  std::size_t operator()(const path::Node &node) const noexcept {
    return node.hash();
  }
};

} // namespace std
