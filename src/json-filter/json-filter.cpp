#include <json-filter/filter/exclusion-filter.hpp>
#include <json-filter/filter/inclusion-filter.hpp>

#include <json-filter/json-filter.hpp>

namespace jsonfilter {

static const InclusionFilter inclusion_filter {};
static const ExclusionFilter exclusion_filter {};

Json apply_inclusion(const Json &source, const std::optional<std::string> &paths) {
  return inclusion_filter.apply(source, paths);
}

Json apply_exclusion(const Json &source, const std::optional<std::string> &paths) {
  return exclusion_filter.apply(source, paths);
}

const Filter &select_filter(FilterType type) {
  switch (type) {
    case FilterType::Inclusion: return inclusion_filter;
    case FilterType::Exclusion: return exclusion_filter;
    default: throw make_unknown_type_error(type);
  }
}

} // namespace jsonfilter
