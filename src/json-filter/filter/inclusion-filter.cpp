#include <json-filter/filter/inclusion-filter.hpp>

namespace jsonfilter {

Json InclusionFilter::filter(const Json *source, const path::Node &node) const {
  if (source == nullptr || source->is_null()) {
    return Json();
  }

  if (source->is_object()) {
    return filter_object(*source, node);
  }

  if (source->is_array()) {
    return filter_array(*source, node);
  }

  // Primitives can't be narrowed any further.
  return *source;
}

Json InclusionFilter::filter_object(const Json &source, const path::Node &node) const {
  if (node.is_terminal()) {
    return source;
  }

  auto filtered = Json::object();

  for (const auto &sub_node : node.get_sub_nodes()) {
    const auto &key = sub_node.get_key();

    auto it = source.find(key);
    if (it == source.end()) continue;

    filtered[key] = filter(&*it, sub_node);
  }

  return filtered;
}

Json InclusionFilter::filter_array(const Json &source, const path::Node &node) const {
  auto filtered = Json::array();

  for (const auto &element : source) {
    filtered.push_back(filter(&element, node));
  }

  return filtered;
}

} // namespace jsonfilter
