#include <json-filter/path/parser.hpp>

#include <json-filter/filter/filter.hpp>

namespace jsonfilter {

Json Filter::apply(const Json *source, const std::optional<std::string> &paths) const {
  auto root = path::Parser().parse(paths);
  return filter(source, root);
}

Json Filter::apply(const Json &source, const std::optional<std::string> &paths) const {
  return apply(&source, paths);
}

Json Filter::apply(const Json &source, const path::Node &root) const {
  return filter(&source, root);
}

} // namespace jsonfilter
