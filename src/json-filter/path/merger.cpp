#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <json-filter/path/merger.hpp>

namespace path {

Node Merger::merge(const Node &node) const {
  return Node(node.get_key(), merge_children(node.get_children()));
}

std::optional<Node> Merger::merge(const std::optional<Node> &node) const {
  if (!node.has_value()) return std::nullopt;
  return merge(node.value());
}

Children Merger::merge_children(const Children &children) const {
  if (std::holds_alternative<Terminal>(children)) {
    return Terminal {};
  }
  return merge_list(std::get<NodeList>(children));
}

NodeList Merger::merge_list(const NodeList &nodes) const {
  // Insertion-ordered key -> accumulated children.
  std::vector<std::pair<std::string, Children>> groups;
  std::unordered_map<std::string, size_t> group_index;

  for (const auto &node : nodes) {
    const auto &key = node.get_key();
    auto it = group_index.find(key);

    if (node.is_terminal()) {
      if (it == group_index.end()) {
        group_index.emplace(key, groups.size());
        groups.emplace_back(key, Terminal {});
      }
      continue;
    }

    if (it == group_index.end()) {
      it = group_index.emplace(key, groups.size()).first;
      groups.emplace_back(key, NodeList {});
    }

    auto &accumulated = groups[it->second].second;
    if (std::holds_alternative<Terminal>(accumulated)) {
      // An explicit list overrides an earlier bare occurrence.
      accumulated = NodeList {};
    }

    auto &list = std::get<NodeList>(accumulated);
    const auto &sub_nodes = node.get_sub_nodes();
    list.insert(list.end(), sub_nodes.begin(), sub_nodes.end());
  }

  NodeList merged;
  merged.reserve(groups.size());
  for (const auto &[key, children] : groups) {
    merged.emplace_back(key, merge_children(children));
  }

  return merged;
}

} // namespace path
