#pragma once

#include <memory>
#include <string_view>

#include <json-filter/filter/filter.hpp>
#include <json-filter/error.hpp>

namespace jsonfilter {

enum class FilterType {
  Inclusion,
  Exclusion
};

InvalidFilterType make_unknown_type_error(FilterType type);

// "INCLUSION" or "EXCLUSION". Throws InvalidFilterType for values outside the
// enumeration.
std::string_view filter_type_name(FilterType type);

// Case-insensitive inverse of filter_type_name.
FilterType filter_type_from_name(std::string_view name);

class FilterFactory {
public:
  std::unique_ptr<Filter> create(FilterType type) const;
};

} // namespace jsonfilter
