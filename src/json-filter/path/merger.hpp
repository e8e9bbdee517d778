#pragma once

#include <optional>

#include <json-filter/path/node.hpp>

namespace path {

// Consolidates sibling nodes that share a key.
//
// A key that only ever appears without parentheses stays terminal. As soon as
// one occurrence carries an explicit list, the key collects the union of all
// such lists, merged recursively. Keys keep their first-seen order.
//
//   a(b(c),b(d))  ->  a(b(c,d))
//   a,a(b)        ->  a(b)
class Merger {
public:
  Node merge(const Node &node) const;
  std::optional<Node> merge(const std::optional<Node> &node) const;
private:
  Children merge_children(const Children &children) const;
  NodeList merge_list(const NodeList &nodes) const;
};

} // namespace path
