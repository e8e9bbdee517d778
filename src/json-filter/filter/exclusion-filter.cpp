#include <utility>

#include <json-filter/filter/exclusion-filter.hpp>

namespace jsonfilter {

Json ExclusionFilter::filter(const Json *source, const path::Node &node) const {
  return filter_value(source, &node);
}

Json ExclusionFilter::filter_value(const Json *source, const path::Node *node) const {
  if (source == nullptr || source->is_null()) {
    return Json();
  }

  if (node == nullptr) {
    return *source;
  }

  if (node->is_terminal()) {
    // Named without sub paths: the parent drops this value entirely.
    return Json();
  }

  if (source->is_object()) {
    return filter_object(*source, *node);
  }

  if (source->is_array()) {
    return filter_array(*source, *node);
  }

  return *source;
}

Json ExclusionFilter::filter_object(const Json &source, const path::Node &node) const {
  auto filtered = source;

  for (const auto &sub_node : node.get_sub_nodes()) {
    auto it = filtered.find(sub_node.get_key());
    if (it == filtered.end()) continue;

    auto value = filter_value(&*it, &sub_node);

    if (value.is_null()) {
      filtered.erase(it);
    } else {
      *it = std::move(value);
    }
  }

  return filtered;
}

Json ExclusionFilter::filter_array(const Json &source, const path::Node &node) const {
  auto filtered = Json::array();

  for (const auto &element : source) {
    filtered.push_back(filter_value(&element, &node));
  }

  return filtered;
}

} // namespace jsonfilter
