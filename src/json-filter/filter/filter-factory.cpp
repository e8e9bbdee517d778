#include <algorithm>
#include <cctype>
#include <format>
#include <initializer_list>
#include <string>

#include <json-filter/filter/exclusion-filter.hpp>
#include <json-filter/filter/inclusion-filter.hpp>

#include <json-filter/filter/filter-factory.hpp>

namespace jsonfilter {

InvalidFilterType make_unknown_type_error(FilterType type) {
  return InvalidFilterType(std::format("Unknown filter type: {}", static_cast<int>(type)));
}

std::string_view filter_type_name(FilterType type) {
  switch (type) {
    case FilterType::Inclusion: return "INCLUSION";
    case FilterType::Exclusion: return "EXCLUSION";
    default: throw make_unknown_type_error(type);
  }
}

FilterType filter_type_from_name(std::string_view name) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });

  for (auto type : { FilterType::Inclusion, FilterType::Exclusion }) {
    if (upper == filter_type_name(type)) return type;
  }

  throw InvalidFilterType(std::format("Unknown filter type name: '{}'", name));
}

std::unique_ptr<Filter> FilterFactory::create(FilterType type) const {
  switch (type) {
    case FilterType::Inclusion: return std::make_unique<InclusionFilter>();
    case FilterType::Exclusion: return std::make_unique<ExclusionFilter>();
    default: throw make_unknown_type_error(type);
  }
}

} // namespace jsonfilter
