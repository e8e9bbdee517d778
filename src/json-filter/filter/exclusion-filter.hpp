#pragma once

#include <json-filter/filter/filter.hpp>

namespace jsonfilter {

// Removes the keys named by terminal nodes of the path expression and keeps
// everything else.
//
// Internally a JSON null result means "drop this key from the parent". As a
// consequence a key whose value is null is always removed once a path
// reaches it, even through a non-terminal node such as `a(b)`.
class ExclusionFilter : public Filter {
protected:
  Json filter(const Json *source, const path::Node &node) const override;
private:
  // A null `node` excludes nothing.
  Json filter_value(const Json *source, const path::Node *node) const;
  Json filter_object(const Json &source, const path::Node &node) const;
  Json filter_array(const Json &source, const path::Node &node) const;
};

} // namespace jsonfilter
