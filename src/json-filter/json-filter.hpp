#pragma once

#include <optional>
#include <string>

#include <json-filter/filter/filter-factory.hpp>
#include <json-filter/filter/filter.hpp>
#include <json-filter/json.hpp>

namespace jsonfilter {

// Keeps only the fields named by `paths`, e.g. `id,user(name,email)`.
Json apply_inclusion(const Json &source, const std::optional<std::string> &paths);

// Removes the fields named by `paths` and keeps the rest.
Json apply_exclusion(const Json &source, const std::optional<std::string> &paths);

// Returns a shared, stateless filter for `type`.
const Filter &select_filter(FilterType type);

} // namespace jsonfilter
