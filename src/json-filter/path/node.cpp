#include <stdexcept>
#include <utility>

#include <json-filter/path/node.hpp>

namespace path {

// Same mixing step as boost::hash_combine.
static void hash_combine(std::size_t &seed, std::size_t value) {
  seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

Node::Node(std::string key, Children children)
  : key(std::move(key))
  , children(std::move(children)) {}

Node::Node(std::string key)
  : Node(std::move(key), Terminal {}) {}

bool Node::is_terminal() const {
  return std::holds_alternative<Terminal>(children);
}

const NodeList &Node::get_sub_nodes() const {
  if (is_terminal()) {
    throw std::logic_error("Terminal node '" + key + "' has no sub nodes");
  }
  return std::get<NodeList>(children);
}

std::string Node::to_string() const {
  std::string out;
  write_to(out);
  return out;
}

void Node::write_to(std::string &out) const {
  out += key;

  if (is_terminal()) return;

  out += '(';
  bool first = true;
  for (const auto &sub_node : std::get<NodeList>(children)) {
    if (!first) out += ',';
    sub_node.write_to(out);
    first = false;
  }
  out += ')';
}

std::size_t Node::hash() const {
  std::size_t seed = std::hash<std::string>{}(key);

  if (is_terminal()) {
    hash_combine(seed, 0);
    return seed;
  }

  const auto &sub_nodes = std::get<NodeList>(children);
  hash_combine(seed, sub_nodes.size() + 1);
  for (const auto &sub_node : sub_nodes) {
    hash_combine(seed, sub_node.hash());
  }
  return seed;
}

bool Node::operator==(const Node &other) const {
  if (key != other.key) return false;
  if (is_terminal() || other.is_terminal()) {
    return is_terminal() == other.is_terminal();
  }
  return std::get<NodeList>(children) == std::get<NodeList>(other.children);
}

std::ostream &operator<<(std::ostream &os, const Node &node) {
  return os << node.to_string();
}

} // namespace path
